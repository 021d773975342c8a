#include "protocol/StatusProtocol.hpp"

#include "util/FileDescriptor.hpp"
#include "util/WriteHelpers.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace protocol {

namespace {

auto trim(std::string_view text) -> std::string_view {
    constexpr std::string_view WHITESPACE = " \t\r\n";
    auto begin = text.find_first_not_of(WHITESPACE);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(WHITESPACE);
    return text.substr(begin, end - begin + 1);
}

// The whole value must parse; "12abc" is rejected rather than read as 12
template<typename T>
auto parse_number(std::string_view text) -> std::optional<T> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto format_double(double value) -> std::string {
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return "0";
    }
    return std::string(buffer.data(), ptr);
}

struct LastLines {
    std::optional<std::string_view> version;
    std::optional<std::string_view> run;
    std::optional<std::string_view> size;
    std::optional<std::string_view> files;
    std::optional<std::string_view> errors;
    TerminalState terminal = TerminalState::NONE;
};

auto scan_lines(std::string_view content) -> LastLines {
    LastLines last;

    while (!content.empty()) {
        auto newline = content.find('\n');
        auto line = content.substr(0, newline);
        content = newline == std::string_view::npos ? std::string_view{}
                                                    : content.substr(newline + 1);

        if (line.starts_with(KEY_SIZE)) {
            last.size = line.substr(KEY_SIZE.size());
        } else if (line.starts_with(KEY_FILES)) {
            last.files = line.substr(KEY_FILES.size());
        } else if (line.starts_with(KEY_ERRORS)) {
            last.errors = line.substr(KEY_ERRORS.size());
        } else if (line.starts_with(KEY_RUN)) {
            last.run = line.substr(KEY_RUN.size());
        } else if (line.starts_with(KEY_VERSION)) {
            last.version = line.substr(KEY_VERSION.size());
        } else if (line.starts_with(LINE_DONE)) {
            last.terminal = TerminalState::DONE;
        } else if (line.starts_with(LINE_STOPPED)) {
            last.terminal = TerminalState::STOPPED;
        }
    }

    return last;
}

}  // namespace

auto encode_fields(const StatusSnapshot& snapshot) -> std::string {
    std::ostringstream out;
    out << KEY_VERSION << snapshot.format_version << '\n'
        << KEY_RUN << snapshot.run_id << '\n'
        << KEY_SIZE << format_double(snapshot.size_gb) << '\n'
        << KEY_FILES << snapshot.file_count << '\n'
        << KEY_ERRORS << snapshot.error_count << '\n';
    return out.str();
}

auto encode_terminal(TerminalState state) -> std::string {
    switch (state) {
        case TerminalState::DONE:
            return std::string(LINE_DONE) + "\n";
        case TerminalState::STOPPED:
            return std::string(LINE_STOPPED) + "\n";
        case TerminalState::NONE:
            break;
    }
    return {};
}

auto encode_status(const StatusSnapshot& snapshot) -> std::string {
    return encode_fields(snapshot) + encode_terminal(snapshot.terminal);
}

auto decode_status(std::string_view content, const StatusSnapshot& previous) -> StatusSnapshot {
    StatusSnapshot snapshot = previous;
    auto last = scan_lines(content);

    if (last.version) {
        if (auto version = parse_number<int>(*last.version)) {
            snapshot.format_version = *version;
        }
    }
    if (last.run) {
        if (auto run = trim(*last.run); !run.empty()) {
            snapshot.run_id = std::string(run);
        }
    }
    if (last.size) {
        auto size = parse_number<double>(*last.size);
        if (size && std::isfinite(*size) && *size >= 0.0) {
            snapshot.size_gb = *size;
        }
    }
    if (last.files) {
        if (auto files = parse_number<int64_t>(*last.files); files && *files >= 0) {
            snapshot.file_count = *files;
        }
    }
    if (last.errors) {
        if (auto errors = parse_number<int64_t>(*last.errors); errors && *errors >= 0) {
            snapshot.error_count = *errors;
        }
    }
    if (last.terminal != TerminalState::NONE) {
        snapshot.terminal = last.terminal;
    }

    return snapshot;
}

auto read_status_file(const std::filesystem::path& path, const StatusSnapshot& previous)
    -> std::optional<StatusSnapshot> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    std::ostringstream content;
    content << in.rdbuf();
    return decode_status(content.str(), previous);
}

StatusWriter::StatusWriter(std::filesystem::path status_path, std::string run_id)
    : status_path_(std::move(status_path)), run_id_(std::move(run_id)) {}

auto StatusWriter::publish(double size_gb, int64_t file_count, int64_t error_count)
    -> util::Result<void> {
    if (finished_) {
        return util::make_error("Status already finished for run " + run_id_);
    }

    StatusSnapshot snapshot{.format_version = STATUS_FORMAT_VERSION,
                            .run_id = run_id_,
                            .size_gb = size_gb,
                            .file_count = file_count,
                            .error_count = error_count,
                            .terminal = TerminalState::NONE};
    return write_content(encode_fields(snapshot), false);
}

auto StatusWriter::finish(TerminalState terminal, double size_gb, int64_t file_count,
                          int64_t error_count) -> util::Result<void> {
    if (terminal == TerminalState::NONE) {
        return util::make_error("A finished run needs a terminal state");
    }

    if (auto written = publish(size_gb, file_count, error_count); !written) {
        return written;
    }

    // Set before the append: even a failed terminal write must not be followed
    // by another keyed block from this run
    finished_ = true;
    return write_content(encode_terminal(terminal), true);
}

auto StatusWriter::write_content(const std::string& content, bool append) -> util::Result<void> {
    auto fd = util::FileDescriptor::open_for_write(status_path_, append);
    if (!fd) {
        int err = errno;
        return util::make_error(
            "Failed to open " + status_path_.string() + ": " + std::strerror(err), err);
    }

    if (!util::write_all(fd.get(), content.data(), content.size())) {
        int err = errno;
        return util::make_error(
            "Failed to write " + status_path_.string() + ": " + std::strerror(err), err);
    }

    if (fd.close() != 0) {
        int err = errno;
        return util::make_error(
            "Failed to close " + status_path_.string() + ": " + std::strerror(err), err);
    }
    return {};
}

}  // namespace protocol
