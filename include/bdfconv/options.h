#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "bdfconv/mapping.h"

struct glyph_range_item {
    char32_t first{0};
    char32_t last{0};
};

struct bdfconv_options {
    std::filesystem::path input_file;
    std::string name;                       // constant name in generated code

    std::optional<mapping_preset> mapping;
    std::vector<glyph_range_item> glyph_ranges;
    std::optional<char32_t> missing_glyph_substitute;
    std::optional<char32_t> replacement_character;
    std::vector<std::string> comments;

    bool list_mappings{false};
    bool lenient_end{false};
    bool strict_counts{false};

    std::filesystem::path plugin_dir{"plugins"};
    std::string exporter;
    std::string exporter_parameters;
    std::filesystem::path output_file;
};
