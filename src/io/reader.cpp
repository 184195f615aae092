#include <tbl/io/reader.hpp>

#include <istream>
#include <utility>

namespace tbl::io {

auto split_fields(std::string_view line, std::string_view delimiter) -> std::vector<std::string> {
    std::vector<std::string> fields;
    if (delimiter.empty()) {
        fields.emplace_back(line);
        return fields;
    }
    std::size_t start = 0;
    while (true) {
        auto pos = line.find(delimiter, start);
        if (pos == std::string_view::npos) {
            fields.emplace_back(line.substr(start));
            break;
        }
        fields.emplace_back(line.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    return fields;
}

auto read_lines(std::istream& input) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

}  // namespace tbl::io
