#include "Document.hpp"

#include "LocaleResolver.hpp"
#include "../config/SiteConfig.hpp"

#include <picosha2.h>

namespace content
{

std::vector<std::string> Document::targetLocales(const SiteConfig& config) const
{
    std::vector<std::string> out;
    switch (translate_to.kind)
    {
    case TranslateTarget::Kind::Disabled:
        break;
    case TranslateTarget::Kind::All:
        for (const auto& l : config.locales)
        {
            if (l != locale)
                out.push_back(l);
        }
        break;
    case TranslateTarget::Kind::Locales:
        for (const auto& l : translate_to.locales)
        {
            if (l != locale)
                out.push_back(l);
        }
        break;
    }
    return out;
}

Document loadDocument(const std::string& relative_path, const std::string& raw, const SiteConfig& config)
{
    Document doc;
    doc.path = relative_path;
    doc.locale = localeOf(relative_path, config);
    doc.raw = raw;
    doc.hash = contentHash(raw);

    if (auto fm = FrontMatter::split(raw))
    {
        doc.has_header = true;
        doc.header = fm->header;
        doc.body = fm->body;
        doc.translate_to = HeaderView::load(fm->header).translateTo(kMarkerKey);
    }
    else
    {
        doc.body = raw;
    }
    return doc;
}

std::string contentHash(const std::string& raw)
{
    std::string hex = picosha2::hash256_hex_string(raw);
    hex.resize(kHashLength);
    return hex;
}

} // namespace content
