#include "odata_name_matcher.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace odata_writer {

static bool EndsWith(const std::string& word, const std::string& suffix) {
    if (word.size() < suffix.size()) {
        return false;
    }
    return std::equal(suffix.rbegin(), suffix.rend(), word.rbegin(),
                      [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)); });
}

static bool IsVowel(char c) {
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'a': case 'e': case 'i': case 'o': case 'u':
            return true;
        default:
            return false;
    }
}

std::string SimplePluralizer::Pluralize(const std::string& word) const {
    if (word.empty()) {
        return word;
    }
    if (EndsWith(word, "y") && word.size() > 1 && !IsVowel(word[word.size() - 2])) {
        return word.substr(0, word.size() - 1) + "ies";
    }
    if (EndsWith(word, "s") || EndsWith(word, "x") || EndsWith(word, "z") ||
        EndsWith(word, "ch") || EndsWith(word, "sh")) {
        return word + "es";
    }
    return word + "s";
}

std::string SimplePluralizer::Singularize(const std::string& word) const {
    if (EndsWith(word, "ies") && word.size() > 3) {
        return word.substr(0, word.size() - 3) + "y";
    }
    if (EndsWith(word, "sses") || EndsWith(word, "xes") || EndsWith(word, "zes") ||
        EndsWith(word, "ches") || EndsWith(word, "shes")) {
        return word.substr(0, word.size() - 2);
    }
    if (EndsWith(word, "s") && !EndsWith(word, "ss") && word.size() > 1) {
        return word.substr(0, word.size() - 1);
    }
    return word;
}

ODataNameMatcher::ODataNameMatcher(std::shared_ptr<Pluralizer> pluralizer)
    : pluralizer(std::move(pluralizer)) {
}

std::string ODataNameMatcher::Homogenize(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

bool ODataNameMatcher::NamesAreEqual(const std::string& actual_name, const std::string& requested_name) const {
    auto actual = Homogenize(actual_name);
    if (actual == Homogenize(requested_name)) {
        return true;
    }
    if (!pluralizer) {
        return false;
    }
    return actual == Homogenize(pluralizer->Singularize(requested_name)) ||
           actual == Homogenize(pluralizer->Pluralize(requested_name));
}

} // namespace odata_writer
