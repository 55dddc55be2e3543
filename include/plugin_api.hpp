// FILE: include/plugin_api.hpp
#pragma once

#include "kernel/operator_executor.hpp"
#include "node.hpp"
#include "og_types.hpp"

/**
 * @brief The function signature that every opgraph plugin must implement
 * and export.
 *
 * When the engine loads a plugin (a .so, .dylib or .dll file), it searches
 * for a function named "register_opgraph_ops" and calls it with the registry
 * the plugin should populate.
 *
 * Use extern "C" to prevent C++ name mangling, which ensures that the
 * engine can find the function by its exact name.
 */
#ifdef _WIN32
#define OPGRAPH_PLUGIN_API __declspec(dllexport)
#else
#define OPGRAPH_PLUGIN_API __attribute__((visibility("default")))
#endif

extern "C" OPGRAPH_PLUGIN_API void register_opgraph_ops(og::OperatorRegistry& registry);
