#include <tsexec/models/tags.h>

#include <ankerl/unordered_dense.h>

#include <algorithm>

namespace tsexec {

    namespace {
        // Separators that do not occur in well formed tag names.
        constexpr char NAME_VALUE_SEPARATOR = '\x1f';
        constexpr char PAIR_SEPARATOR = '\x1e';

        bool listed(const std::vector<std::string> &names, const std::string &name) {
            return std::find(names.begin(), names.end(), name) != names.end();
        }

        auto find_name(const Tags::collection_type &tags, std::string_view name) {
            return std::lower_bound(tags.begin(), tags.end(), name,
                                    [](const Tag &tag, std::string_view n) { return tag.name < n; });
        }
    } // namespace

    Tags::Tags(std::initializer_list<Tag> tags) {
        _tags.reserve(tags.size());
        for (const auto &tag: tags) { add(tag.name, tag.value); }
    }

    Tags::Tags(std::vector<Tag> tags) {
        _tags.reserve(tags.size());
        for (auto &tag: tags) { add(std::move(tag.name), std::move(tag.value)); }
    }

    Tags &Tags::add(std::string name, std::string value) {
        auto it = std::lower_bound(_tags.begin(), _tags.end(), name,
                                   [](const Tag &tag, const std::string &n) { return tag.name < n; });
        if (it != _tags.end() && it->name == name) {
            it->value = std::move(value);
        } else {
            _tags.insert(it, Tag{std::move(name), std::move(value)});
        }
        return *this;
    }

    std::optional<std::string_view> Tags::get(std::string_view name) const {
        auto it = find_name(_tags, name);
        if (it != _tags.end() && it->name == name) { return std::string_view{it->value}; }
        return std::nullopt;
    }

    bool Tags::contains(std::string_view name) const { return get(name).has_value(); }

    Tags Tags::tags_with_keys(const std::vector<std::string> &names) const {
        Tags result;
        for (const auto &tag: _tags) {
            if (listed(names, tag.name)) { result._tags.push_back(tag); }
        }
        return result;
    }

    Tags Tags::tags_without_keys(const std::vector<std::string> &names) const {
        Tags result;
        for (const auto &tag: _tags) {
            if (!listed(names, tag.name)) { result._tags.push_back(tag); }
        }
        return result;
    }

    uint64_t Tags::id() const {
        std::string buffer;
        size_t length = 0;
        for (const auto &tag: _tags) { length += tag.name.size() + tag.value.size() + 2; }
        buffer.reserve(length);
        for (const auto &tag: _tags) {
            buffer.append(tag.name);
            buffer.push_back(NAME_VALUE_SEPARATOR);
            buffer.append(tag.value);
            buffer.push_back(PAIR_SEPARATOR);
        }
        return ankerl::unordered_dense::hash<std::string_view>{}(std::string_view{buffer});
    }

    std::string Tags::to_string() const {
        std::vector<std::string> parts;
        parts.reserve(_tags.size());
        for (const auto &tag: _tags) { parts.push_back(fmt::format("{}=\"{}\"", tag.name, tag.value)); }
        return fmt::format("{{{}}}", fmt::join(parts, ", "));
    }

} // namespace tsexec
