#include <lang/Language.hpp>

#include <str/util.hpp>
#include <util/log.hpp>

#include <algorithm>

namespace lang {

    std::ostream &operator<<(std::ostream &os, Language language)
    {
        switch (language)
        {
            case Language::CSharp: os << "csharp"; break;
            case Language::Python: os << "python"; break;
            case Language::JavaScript: os << "javascript"; break;
            case Language::Java: os << "java"; break;
            case Language::Html: os << "html"; break;
            case Language::Css: os << "css"; break;
            case Language::Jsx: os << "jsx"; break;
            case Language::Angular: os << "angular"; break;
        }
        return os;
    }

    const std::vector<Language> &languages()
    {
        static const std::vector<Language> s_languages = {
            Language::CSharp,
            Language::Python,
            Language::JavaScript,
            Language::Java,
            Language::Html,
            Language::Css,
            Language::Jsx,
            Language::Angular,
        };
        return s_languages;
    }

    std::optional<Language> language(const std::string_view &name)
    {
        const auto n = str::to_lower(name);
        if (n == "csharp") return Language::CSharp;
        if (n == "python") return Language::Python;
        if (n == "javascript") return Language::JavaScript;
        if (n == "java") return Language::Java;
        if (n == "html") return Language::Html;
        if (n == "css") return Language::Css;
        if (n == "jsx") return Language::Jsx;
        if (n == "angular") return Language::Angular;
        return std::nullopt;
    }

    bool is_all(const std::string_view &name)
    {
        return str::iequals(name, "all");
    }

    const std::vector<std::string> &extensions(Language language)
    {
        static const std::vector<std::string> s_cs = {".cs"};
        static const std::vector<std::string> s_py = {".py"};
        static const std::vector<std::string> s_js = {".js"};
        static const std::vector<std::string> s_java = {".java"};
        static const std::vector<std::string> s_html = {".html", ".htm"};
        static const std::vector<std::string> s_css = {".css"};
        static const std::vector<std::string> s_jsx = {".jsx"};
        static const std::vector<std::string> s_ts = {".ts"};
        static const std::vector<std::string> s_none;
        switch (language)
        {
            case Language::CSharp: return s_cs;
            case Language::Python: return s_py;
            case Language::JavaScript: return s_js;
            case Language::Java: return s_java;
            case Language::Html: return s_html;
            case Language::Css: return s_css;
            case Language::Jsx: return s_jsx;
            case Language::Angular: return s_ts;
        }
        return s_none;
    }

    std::vector<std::string> extensions(const std::vector<std::string> &names)
    {
        std::vector<Language> selection;
        if (std::any_of(names.begin(), names.end(), [](const auto &name) { return is_all(name); }))
        {
            selection = languages();
        }
        else
        {
            for (const auto &name : names)
            {
                if (const auto l = language(name); !!l)
                    selection.push_back(*l);
                else
                    util::log::verbose() << "Dropping unknown language '" << name << "'" << std::endl;
            }
        }

        std::vector<std::string> exts;
        for (const auto l : selection)
            for (const auto &ext : extensions(l))
                if (std::find(exts.begin(), exts.end(), ext) == exts.end())
                    exts.push_back(ext);
        return exts;
    }

} // namespace lang
