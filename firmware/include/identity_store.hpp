#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "mesh_types.hpp"

constexpr std::size_t kDeviceNameSuffixLength = 6;

// "device-" followed by base58 characters.
std::string generate_device_name(std::mt19937& rng);
bool is_valid_device_name(const std::string& name);

class IdentityStore {
public:
    virtual ~IdentityStore() = default;
    // Same name for the lifetime of the installation.
    virtual bool get_persistent_name(PeerName& out) = 0;
};

// Creates the name once and keeps it in a one-line text file.
class FileIdentityStore : public IdentityStore {
public:
    explicit FileIdentityStore(std::string path, uint32_t seed = 0);
    bool get_persistent_name(PeerName& out) override;

private:
    bool load(PeerName& out) const;
    bool save(const PeerName& name) const;

    std::string path_;
    std::mt19937 rng_;
    PeerName cached_;
};

class FixedIdentityStore : public IdentityStore {
public:
    explicit FixedIdentityStore(PeerName name) : name_(std::move(name)) {}
    bool get_persistent_name(PeerName& out) override {
        if (name_.empty()) {
            return false;
        }
        out = name_;
        return true;
    }

private:
    PeerName name_;
};
