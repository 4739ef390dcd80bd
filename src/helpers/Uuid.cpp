#include "Uuid.hpp"

#include <cstdint>
#include <format>
#include <uuid/uuid.h>

#include <hyprutils/memory/Casts.hpp>
using namespace Hyprutils::Memory;

std::string Hyprview::Uuid::generate() {
    uuid_t uuid_;
    uuid_generate_random(uuid_);

    return std::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}", sc<uint16_t>(uuid_[0]), sc<uint16_t>(uuid_[1]),
                       sc<uint16_t>(uuid_[2]), sc<uint16_t>(uuid_[3]), sc<uint16_t>(uuid_[4]), sc<uint16_t>(uuid_[5]), sc<uint16_t>(uuid_[6]), sc<uint16_t>(uuid_[7]),
                       sc<uint16_t>(uuid_[8]), sc<uint16_t>(uuid_[9]), sc<uint16_t>(uuid_[10]), sc<uint16_t>(uuid_[11]), sc<uint16_t>(uuid_[12]), sc<uint16_t>(uuid_[13]),
                       sc<uint16_t>(uuid_[14]), sc<uint16_t>(uuid_[15]));
}

bool Hyprview::Uuid::isValid(const std::string& uuid) {
    uuid_t parsed;
    return uuid_parse(uuid.c_str(), parsed) == 0;
}
