/// \file
/// \brief Exporter parameter string parsing.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/plugin_options.h"

namespace {

/// \brief trim.
std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // namespace

/// \brief plugin_options::parse.
bool plugin_options::parse(std::string_view text, plugin_options& out, std::string& err) {
    plugin_options result;
    while (!trim(text).empty()) {
        const std::size_t comma = text.find(',');
        const std::string_view item = trim(text.substr(0, comma));
        text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);
        if (item.empty()) continue;

        const std::size_t eq = item.find('=');
        const std::string_view key = trim(item.substr(0, eq));
        if (eq == std::string_view::npos || key.empty()) {
            err = "invalid exporter parameter \"" + std::string(item) + "\"; expected key=value";
            return false;
        }
        result.items_.emplace_back(std::string(key), std::string(trim(item.substr(eq + 1))));
    }
    out = std::move(result);
    out.refresh_views();
    return true;
}

/// \brief plugin_options::set.
void plugin_options::set(std::string key, std::string value) {
    items_.emplace_back(std::move(key), std::move(value));
    refresh_views();
}

/// \brief plugin_options::get.
const std::string* plugin_options::get(std::string_view key) const {
    for (auto it = items_.rbegin(); it != items_.rend(); ++it) {
        if (it->first == key) return &it->second;
    }
    return nullptr;
}

/// \brief plugin_options::refresh_views.
void plugin_options::refresh_views() {
    views_.clear();
    for (const auto& [key, value] : items_) views_.push_back(bdfconv_kv{key.c_str(), value.c_str()});
}
