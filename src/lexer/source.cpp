#include "lexer/source.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace sidl::lexer {

Source::Source(std::string filename, std::string content)
    : filename_(std::move(filename)), content_(std::move(content)) {
    build_line_index();
}

void Source::build_line_index() {
    line_offsets_.assign(1, 0);

    auto newline = content_.find('\n');
    while (newline != std::string::npos) {
        line_offsets_.push_back(newline + 1);
        newline = content_.find('\n', newline + 1);
    }
}

auto Source::at(size_t offset) const -> char {
    if (offset >= content_.size()) {
        return '\0';
    }
    return content_[offset];
}

auto Source::slice(size_t start, size_t end) const -> std::string_view {
    if (end <= start || start >= content_.size()) {
        return {};
    }
    std::string_view view(content_);
    return view.substr(start, std::min(end, content_.size()) - start);
}

auto Source::location(size_t offset) const -> SourceLocation {
    // Last line start that is <= offset; the first entry is always 0
    auto next_line = std::partition_point(line_offsets_.begin(), line_offsets_.end(),
                                          [offset](size_t start) { return start <= offset; });
    auto line_start = std::prev(next_line);

    return SourceLocation{
        .file = filename_,
        .line = static_cast<uint32_t>(std::distance(line_offsets_.begin(), next_line)),
        .column = static_cast<uint32_t>(offset - *line_start) + 1,
        .offset = static_cast<uint32_t>(offset),
        .length = 1,
    };
}

auto Source::line(uint32_t line_num) const -> std::string_view {
    if (line_num < 1 || line_num > line_offsets_.size()) {
        return {};
    }

    std::string_view text = std::string_view(content_).substr(line_offsets_[line_num - 1]);
    text = text.substr(0, text.find('\n'));
    if (!text.empty() && text.back() == '\r') {
        text.remove_suffix(1);
    }
    return text;
}

auto Source::from_file(const std::string& path) -> Result<Source, std::string> {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return "cannot open model file: " + path;
    }

    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        return "cannot read model file: " + path;
    }
    return Source(path, content.str());
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace sidl::lexer
