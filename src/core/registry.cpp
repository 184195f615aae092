#include <tbl/core/registry.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <istream>
#include <utility>

namespace tbl {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

}  // namespace

auto is_identifier(std::string_view text, char sentinel) noexcept -> bool {
    if (text.size() < 2 || text.front() != sentinel) {
        return false;
    }
    for (char ch : text.substr(1)) {
        if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
            return false;
        }
    }
    return true;
}

auto strip_label_namespace(std::string_view raw) -> std::string {
    auto colon = raw.find(':');
    if (colon == std::string_view::npos) {
        return std::string(raw);
    }
    return std::string(raw.substr(colon + 1));
}

auto ColumnRegistry::number_of(std::string_view name) const -> std::optional<ColumnNumber> {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto ColumnRegistry::name_of(ColumnNumber number) const -> const std::string& {
    return names_.at(number - 1);
}

auto ColumnRegistry::label_of(ColumnNumber number) const -> const std::string& {
    return labels_.at(number - 1);
}

auto ColumnRegistry::is_identifier(std::string_view text) const noexcept -> bool {
    return tbl::is_identifier(text, sentinel_);
}

auto build_registry(const NameGenerator& generator, const LabelLookup& labels,
                    RegistryOptions options) -> Result<ColumnRegistry> {
    if (!generator) {
        return make_error(ErrorKind::Configuration,
                          "missing column name generator: it must produce an ordered list of "
                          "column identifiers");
    }
    auto names = generator();
    if (names.empty()) {
        return make_error(ErrorKind::Configuration, "column name generator produced no names");
    }

    ColumnRegistry registry;
    registry.sentinel_ = options.sentinel;
    registry.names_.reserve(names.size());
    registry.labels_.reserve(names.size());
    registry.index_.reserve(names.size());

    for (auto& name : names) {
        if (!is_identifier(name, options.sentinel)) {
            return make_error(ErrorKind::Configuration,
                              fmt::format("malformed column identifier '{}': expected '{}' "
                                          "followed by letters, digits or underscores",
                                          name, options.sentinel));
        }
        const ColumnNumber number = registry.names_.size() + 1;
        if (!registry.index_.emplace(name, number).second) {
            return make_error(ErrorKind::Configuration,
                              fmt::format("duplicate column identifier '{}'", name));
        }
        std::string label;
        if (labels) {
            if (auto raw = labels(name); raw.has_value()) {
                label = strip_label_namespace(*raw);
            }
        }
        registry.labels_.push_back(std::move(label));
        registry.names_.push_back(std::move(name));
    }

    spdlog::debug("column registry built: {} columns", registry.size());
    return registry;
}

auto names_generator(std::vector<std::string> names) -> NameGenerator {
    return [names = std::move(names)]() { return names; };
}

auto read_names(std::istream& input) -> std::vector<std::string> {
    std::vector<std::string> names;
    std::string line;
    while (std::getline(input, line)) {
        auto name = trim(line);
        if (!name.empty()) {
            names.emplace_back(name);
        }
    }
    return names;
}

auto env_label_lookup(std::string prefix) -> LabelLookup {
    return [prefix = std::move(prefix)](std::string_view name) -> std::optional<std::string> {
        std::string variable = prefix + std::string(name);
        const char* value = std::getenv(variable.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

}  // namespace tbl
