#include "identity_store.hpp"

#include "logging.hpp"

#include <cstdio>
#include <cstring>

namespace {
const char kBase58Alphabet[] = "123456789abcdefghijkmnopqrstuvwxyzABCDEFGHJKLMNPQRSTUVWXYZ";
const char kNamePrefix[] = "device-";
constexpr std::size_t kPrefixLength = sizeof(kNamePrefix) - 1;
constexpr std::size_t kAlphabetLength = sizeof(kBase58Alphabet) - 1;
} // namespace

std::string generate_device_name(std::mt19937& rng) {
    std::uniform_int_distribution<std::size_t> pick(0, kAlphabetLength - 1);
    std::string name(kNamePrefix);
    for (std::size_t i = 0; i < kDeviceNameSuffixLength; ++i) {
        name.push_back(kBase58Alphabet[pick(rng)]);
    }
    return name;
}

bool is_valid_device_name(const std::string& name) {
    if (name.size() != kPrefixLength + kDeviceNameSuffixLength) {
        return false;
    }
    if (name.compare(0, kPrefixLength, kNamePrefix) != 0) {
        return false;
    }
    for (std::size_t i = kPrefixLength; i < name.size(); ++i) {
        if (name[i] == '\0' || std::strchr(kBase58Alphabet, name[i]) == nullptr) {
            return false;
        }
    }
    return true;
}

FileIdentityStore::FileIdentityStore(std::string path, uint32_t seed) : path_(std::move(path)) {
    if (seed == 0) {
        std::random_device rd;
        rng_.seed(rd());
    } else {
        rng_.seed(seed);
    }
}

bool FileIdentityStore::get_persistent_name(PeerName& out) {
    if (!cached_.empty()) {
        out = cached_;
        return true;
    }
    PeerName name;
    if (load(name)) {
        cached_ = name;
        out = cached_;
        return true;
    }
    name = generate_device_name(rng_);
    if (!save(name)) {
        log_warn("[ID] could not persist %s to %s, name lasts for this run only", name.c_str(), path_.c_str());
    } else {
        log_info("[ID] created identity %s", name.c_str());
    }
    cached_ = name;
    out = cached_;
    return true;
}

bool FileIdentityStore::load(PeerName& out) const {
    FILE* f = std::fopen(path_.c_str(), "r");
    if (f == nullptr) {
        return false;
    }
    char buf[64] = {};
    const bool read = std::fgets(buf, sizeof(buf), f) != nullptr;
    std::fclose(f);
    if (!read) {
        return false;
    }
    std::string name(buf);
    while (!name.empty() && (name.back() == '\n' || name.back() == '\r' || name.back() == ' ')) {
        name.pop_back();
    }
    if (!is_valid_device_name(name)) {
        log_warn("[ID] ignoring malformed identity in %s", path_.c_str());
        return false;
    }
    out = name;
    return true;
}

bool FileIdentityStore::save(const PeerName& name) const {
    FILE* f = std::fopen(path_.c_str(), "w");
    if (f == nullptr) {
        return false;
    }
    const bool ok = std::fprintf(f, "%s\n", name.c_str()) > 0;
    return std::fclose(f) == 0 && ok;
}
