#pragma once

#include <memory>
#include <string>
#include <vector>

namespace odata_writer {

// Converts English nouns between singular and plural form
class Pluralizer {
public:
    virtual ~Pluralizer() = default;
    virtual std::string Pluralize(const std::string& word) const = 0;
    virtual std::string Singularize(const std::string& word) const = 0;
};

/**
 * Suffix-rule pluralizer covering the regular English forms
 * (Order/Orders, Category/Categories, Address/Addresses).
 */
class SimplePluralizer : public Pluralizer {
public:
    std::string Pluralize(const std::string& word) const override;
    std::string Singularize(const std::string& word) const override;
};

/**
 * Name Matcher
 *
 * Matches caller-supplied field names against declared schema names.
 * Names are compared after homogenizing (lowercase, non-alphanumerics
 * dropped), then against the singular and plural forms of the requested name
 * when a pluralizer is configured.
 *
 * Usage:
 *   ODataNameMatcher matcher(std::make_shared<SimplePluralizer>());
 *   matcher.NamesAreEqual("Employees", "employee");      // true
 *   matcher.NamesAreEqual("Order_Details", "OrderDetail"); // true
 */
class ODataNameMatcher {
public:
    explicit ODataNameMatcher(std::shared_ptr<Pluralizer> pluralizer = std::make_shared<SimplePluralizer>());

    bool NamesAreEqual(const std::string& actual_name, const std::string& requested_name) const;

    static std::string Homogenize(const std::string& name);

    /**
     * Find the item whose name matches the requested name. An exact match wins
     * over an insensitive one; among insensitive matches the first one wins.
     *
     * @return Pointer into items, or nullptr if nothing matches
     */
    template <class TItem, class TNameGetter>
    const TItem* BestMatch(const std::vector<TItem>& items, const std::string& requested_name, TNameGetter name_of) const {
        for (const auto& item : items) {
            if (name_of(item) == requested_name) {
                return &item;
            }
        }
        for (const auto& item : items) {
            if (NamesAreEqual(name_of(item), requested_name)) {
                return &item;
            }
        }
        return nullptr;
    }

    bool HasPluralizer() const { return pluralizer != nullptr; }

private:
    std::shared_ptr<Pluralizer> pluralizer;
};

} // namespace odata_writer
