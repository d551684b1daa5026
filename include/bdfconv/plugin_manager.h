#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct bdfconv_plugin_info; // from the C header

struct loaded_plugin {
    void* handle = nullptr;                 // dlopen handle
    const bdfconv_plugin_info* info = nullptr;
    std::filesystem::path path;
};

class plugin_manager {
public:
    plugin_manager() = default;
    plugin_manager(const plugin_manager&) = delete;
    plugin_manager& operator=(const plugin_manager&) = delete;
    ~plugin_manager();

    // scan a directory for *.so and load plugins; broken plugins are
    // reported on stderr and skipped
    void load_from_dir(const std::filesystem::path& dir);

    const std::vector<loaded_plugin>& plugins() const { return plugins_; }
    const loaded_plugin* find(std::string_view name) const;

private:
    void unload();

    std::vector<loaded_plugin> plugins_;
};
