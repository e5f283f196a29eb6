#pragma once

#include <string>
#include <string_view>

// Values requirement markers are evaluated against, fixed for one target
// runtime. The deployment host is Linux on x86_64.
struct MarkerEnvironment {
    std::string python_version;       // "3.6"
    std::string python_full_version;  // "3.6.0"
    std::string sys_platform = "linux";
    std::string platform_system = "Linux";
    std::string platform_machine = "x86_64";
    std::string os_name = "posix";
    std::string implementation_name = "cpython";
    std::string platform_python_implementation = "CPython";
};

// "python3.6" -> python_version "3.6", python_full_version "3.6.0"
MarkerEnvironment marker_environment_for_runtime(const std::string& runtime);

// Evaluates a marker such as `python_version < "3.8" and sys_platform != "win32"`.
// No extras are requested, so `extra == "..."` is false.
// Throws FnpackException on a malformed marker or an unknown variable.
bool evaluate_marker(std::string_view marker, const MarkerEnvironment& env);

// Dotted numeric comparison, missing components count as 0. Returns <0, 0 or >0.
int compare_versions(std::string_view a, std::string_view b);
