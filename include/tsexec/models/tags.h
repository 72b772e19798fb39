#ifndef TSEXEC_MODELS_TAGS_H
#define TSEXEC_MODELS_TAGS_H

#include <tsexec/tsexec_base.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsexec {

    struct TSEXEC_EXPORT Tag {
        std::string name;
        std::string value;

        bool operator==(const Tag &other) const = default;
    };

    /**
     * An unordered set of name/value pairs identifying a series.
     *
     * The pairs are held sorted by name with unique names, so two sets built from the same pairs in any order
     * compare equal and produce the same id(). Adding a name that is already present replaces its value.
     */
    struct TSEXEC_EXPORT Tags {
        using collection_type = std::vector<Tag>;
        using const_iterator = collection_type::const_iterator;

        Tags() = default;

        Tags(std::initializer_list<Tag> tags);

        explicit Tags(std::vector<Tag> tags);

        Tags &add(std::string name, std::string value);

        [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const;

        [[nodiscard]] bool contains(std::string_view name) const;

        [[nodiscard]] size_t size() const { return _tags.size(); }

        [[nodiscard]] bool empty() const { return _tags.empty(); }

        [[nodiscard]] const_iterator begin() const { return _tags.begin(); }

        [[nodiscard]] const_iterator end() const { return _tags.end(); }

        /**
         * The subset of tags whose names are listed, names not present are ignored.
         */
        [[nodiscard]] Tags tags_with_keys(const std::vector<std::string> &names) const;

        /**
         * Every tag except the ones whose names are listed.
         */
        [[nodiscard]] Tags tags_without_keys(const std::vector<std::string> &names) const;

        /**
         * A 64-bit hash of the sorted pairs. Distinct sets may collide, callers accept that risk.
         */
        [[nodiscard]] uint64_t id() const;

        [[nodiscard]] std::string to_string() const;

        bool operator==(const Tags &other) const = default;

    private:
        collection_type _tags;
    };

} // namespace tsexec

#endif // TSEXEC_MODELS_TAGS_H
