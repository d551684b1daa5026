#include "bdfconv/plugin_manager.h"
#include <dlfcn.h>
#include <algorithm>
#include <iostream>
#include <filesystem>
#include "bdfconv/plugin.h"

namespace fs = std::filesystem;

plugin_manager::~plugin_manager() {
    unload();
}

void plugin_manager::unload() {
    for (auto& p : plugins_) {
        if (p.handle) dlclose(p.handle);
    }
    plugins_.clear();
}

void plugin_manager::load_from_dir(const fs::path& dir) {
    unload();
    std::error_code ec;
    if (!fs::exists(dir, ec) || !fs::is_directory(dir, ec)) {
        return; // not fatal; just no plugins
    }

    // sorted so a duplicate plugin name always resolves the same way
    std::vector<fs::path> candidates;
    for (auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != ".so") continue;
        candidates.push_back(entry.path());
    }
    std::sort(candidates.begin(), candidates.end());

    for (const auto& path : candidates) {
        void* h = dlopen(path.c_str(), RTLD_NOW);
        if (!h) {
            std::cerr << "dlopen failed: " << dlerror() << " (" << path << ")\n";
            continue;
        }
        using get_fn_t = int (*)(const bdfconv_plugin_info**);
        dlerror(); // clear
        auto* sym = reinterpret_cast<get_fn_t>(dlsym(h, "bdfconv_plugin_get"));
        const char* dler = dlerror();
        if (dler || !sym) {
            std::cerr << "dlsym bdfconv_plugin_get failed: " << (dler ? dler : "null") << "\n";
            dlclose(h);
            continue;
        }
        const bdfconv_plugin_info* info = nullptr;
        if (sym(&info) != 0 || !info || !info->name) {
            std::cerr << "plugin get() failed: " << path << "\n";
            dlclose(h);
            continue;
        }
        if (info->abi_version != BDFCONV_PLUGIN_ABI_VERSION || !info->export_font) {
            std::cerr << "ABI/version mismatch or missing export in " << path << "\n";
            dlclose(h);
            continue;
        }
        loaded_plugin lp;
        lp.handle = h;
        lp.info = info;
        lp.path = path;
        plugins_.push_back(lp);
    }
}

const loaded_plugin* plugin_manager::find(std::string_view name) const {
    for (const auto& p : plugins_) {
        if (name == p.info->name) return &p;
    }
    return nullptr;
}
