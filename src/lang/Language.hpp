#ifndef HEADER_lang_Language_hpp_ALREADY_INCLUDED
#define HEADER_lang_Language_hpp_ALREADY_INCLUDED

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace lang {

    enum class Language
    {
        CSharp,
        Python,
        JavaScript,
        Java,
        Html,
        Css,
        Jsx,
        Angular,
    };

    // Prints the identifier as accepted by `--language`
    std::ostream &operator<<(std::ostream &os, Language language);

    const std::vector<Language> &languages();

    // Case-insensitive lookup of a language identifier
    std::optional<Language> language(const std::string_view &name);

    bool is_all(const std::string_view &name);

    // Lowercase extensions including the leading '.'
    const std::vector<std::string> &extensions(Language language);

    // Deduplicated extensions for a set of identifiers. Unknown identifiers are
    // dropped, 'all' anywhere selects every extension.
    std::vector<std::string> extensions(const std::vector<std::string> &names);

} // namespace lang

#endif
