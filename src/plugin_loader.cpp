// Implementation of plugin loading
#include "plugin_loader.hpp"

#include <algorithm>
#include <iterator>
#include <set>

#include "og_types.hpp"

#ifdef _WIN32
  #include <windows.h>
#else
  #include <dlfcn.h>
#endif

namespace og {

namespace {

#if defined(_WIN32)
const char* kPluginExtension = ".dll";
#elif defined(__APPLE__)
const char* kPluginExtension = ".dylib";
#else
const char* kPluginExtension = ".so";
#endif

using RegisterFunc = void (*)(OperatorRegistry&);

} // namespace

PluginLoadResult load_plugins(const std::vector<std::string>& plugin_dir_paths,
                              OperatorRegistry& registry,
                              std::map<std::string, std::string>& op_sources) {
    PluginLoadResult result;

    auto process_path = [&](const fs::path& path) {
        if (path.extension() != kPluginExtension) return;  // skip non-shared libraries
        ++result.attempted;
        const std::string abs_path = fs::absolute(path).string();
        auto keys_before = registry.get_keys();

        #ifdef _WIN32
        HMODULE handle = LoadLibraryA(path.string().c_str());
        if (!handle) {
            result.errors.push_back({abs_path, GraphErrc::Io, "LoadLibrary failed, code " + std::to_string(GetLastError())});
            return;
        }
        auto register_func = reinterpret_cast<RegisterFunc>(GetProcAddress(handle, "register_opgraph_ops"));
        if (!register_func) {
            result.errors.push_back({abs_path, GraphErrc::NotFound, "missing 'register_opgraph_ops' export"});
            FreeLibrary(handle);
            return;
        }
        #else
        void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (!handle) {
            const char* err = dlerror();
            result.errors.push_back({abs_path, GraphErrc::Io, err ? err : "dlopen failed"});
            return;
        }
        dlerror();
        RegisterFunc register_func;
        *reinterpret_cast<void**>(&register_func) = dlsym(handle, "register_opgraph_ops");
        const char* dlsym_error = dlerror();
        if (dlsym_error || !register_func) {
            result.errors.push_back({abs_path, GraphErrc::NotFound,
                                     std::string("missing 'register_opgraph_ops' export: ") +
                                         (dlsym_error ? dlsym_error : "null symbol")});
            dlclose(handle);
            return;
        }
        #endif

        try {
            register_func(registry);
        } catch (const std::exception& e) {
            result.errors.push_back({abs_path, GraphErrc::Unknown,
                                     std::string("exception during registration: ") + e.what()});
            // 已注册的算子可能引用库内代码，保持库常驻
            return;
        }
        auto keys_after = registry.get_keys();
        std::vector<std::string> new_keys;
        std::set_difference(keys_after.begin(), keys_after.end(), keys_before.begin(), keys_before.end(),
                            std::back_inserter(new_keys));
        for (const auto& key : new_keys) {
            op_sources[key] = abs_path;
            result.new_op_keys.push_back(key);
        }
        ++result.loaded;
    };

    auto iter_and_load = [&](const fs::path& base_dir, bool recursive) {
        std::error_code ec;
        if (!fs::exists(base_dir, ec) || !fs::is_directory(base_dir, ec)) return;
        if (recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(base_dir, ec)) {
                if (entry.is_regular_file()) process_path(entry.path());
            }
        } else {
            for (const auto& entry : fs::directory_iterator(base_dir, ec)) {
                if (entry.is_regular_file()) process_path(entry.path());
            }
        }
    };

    for (const auto& raw_path : plugin_dir_paths) {
        if (raw_path.empty()) continue;
        // Interpret simple wildcard suffixes:
        //   path/**  => recursive
        //   path/*   => shallow (explicit)
        //   path     => shallow
        bool recursive = false;
        std::string path_str = raw_path;
        if (path_str.size() >= 3 && path_str.substr(path_str.size() - 3) == "/**") {
            recursive = true;
            path_str = path_str.substr(0, path_str.size() - 3);
        } else if (path_str.size() >= 2 && path_str.substr(path_str.size() - 2) == "/*") {
            path_str = path_str.substr(0, path_str.size() - 2);
        }
        iter_and_load(path_str, recursive);
    }
    return result;
}

} // namespace og
