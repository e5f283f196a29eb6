#pragma once

#include <stdexcept>
#include <string>

class FnpackException : public std::runtime_error {
public:
    explicit FnpackException(const std::string& message)
        : std::runtime_error(message) {}
};

// A declared requirement (or the root itself) is not in the installed-package index.
class UnresolvedDependencyError : public FnpackException {
public:
    using FnpackException::FnpackException;
};

// Transport or HTTP failure while talking to the package registry.
class RegistryError : public FnpackException {
public:
    using FnpackException::FnpackException;
};

// Every acquisition strategy was exhausted for a dependency.
class NoSuitableArtifactError : public FnpackException {
public:
    using FnpackException::FnpackException;
};

class UnsupportedLocalLayoutError : public FnpackException {
public:
    using FnpackException::FnpackException;
};

class OwnershipManifestMissingError : public FnpackException {
public:
    using FnpackException::FnpackException;
};

class NotImplementedError : public FnpackException {
public:
    using FnpackException::FnpackException;
};
