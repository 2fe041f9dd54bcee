#pragma once

#include "TemplateSpec.h"

#include <string>
#include <vector>

namespace mindgraph {

/// Named templates, in registration order.
class TemplateCatalog {
public:
    TemplateCatalog() = default;

    /// Catalog holding the ten templates shipped with the application
    static TemplateCatalog builtin();

    /// Add a template, replacing any existing one with the same key
    void registerTemplate(const std::string& key, TemplateSpec spec);

    /// nullptr for unknown keys
    const TemplateSpec* find(const std::string& key) const;

    bool contains(const std::string& key) const { return find(key) != nullptr; }

    std::vector<std::string> keys() const;
    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        std::string key;
        TemplateSpec spec;
    };

    std::vector<Entry> entries_;
};

}  // namespace mindgraph
