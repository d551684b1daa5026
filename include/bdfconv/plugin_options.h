/// \file
/// \brief Owned key=value option list handed to plugins.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bdfconv/plugin.h"

class plugin_options {
public:
    // "key=value,key=value"; whitespace around keys and values is trimmed
    static bool parse(std::string_view text, plugin_options& out, std::string& err);

    void set(std::string key, std::string value);
    const std::string* get(std::string_view key) const;

    // valid until the next set() or parse()
    const bdfconv_kv* data() const { return views_.data(); }
    unsigned size() const { return static_cast<unsigned>(views_.size()); }

private:
    void refresh_views();

    std::vector<std::pair<std::string, std::string>> items_;
    std::vector<bdfconv_kv> views_;
};
