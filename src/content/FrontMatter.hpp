#pragma once

#include "YamlScalar.hpp"

#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace content
{

constexpr const char* kDelimiter = "---";

// A document cut at its header delimiters. join() of an unmodified value
// returns the original text byte for byte.
struct FrontMatter
{
    std::string open;   // opening delimiter line including its line break
    std::string header; // lines between the delimiters, without the final line break
    bool has_header_lines = false;
    std::string close;  // closing delimiter line including its line break, if any
    std::string body;

    static std::optional<FrontMatter> split(const std::string& document);
    static bool hasHeader(const std::string& document);

    // New document in the canonical layout used for generated files.
    static std::string compose(const std::string& header, const std::string& body);

    std::string join() const;
};

struct TranslateTarget
{
    enum class Kind
    {
        Disabled,
        All,
        Locales
    };

    Kind kind = Kind::Disabled;
    std::vector<std::string> locales;
};

// Read-only typed view over a header, backed by yaml-cpp. Only the handful of
// fields the engine consumes have accessors; nothing is written through it.
class HeaderView
{
public:
    static HeaderView load(const std::string& header_text);

    bool valid() const { return valid_; }

    std::optional<std::string> stringField(const std::string& key) const;
    TranslateTarget translateTo(const std::string& marker_key) const;
    // Empty for a null value; nullopt when the key is absent, the value is not
    // a map, or the header did not parse.
    std::optional<StringPairs> alternates(const std::string& key) const;
    std::optional<std::string> permalink() const { return stringField("permalink"); }
    bool hasField(const std::string& key) const;

private:
    YAML::Node root_;
    bool valid_ = false;
};

} // namespace content
