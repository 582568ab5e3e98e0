#pragma once

#define RELAYDROP_VERSION "1.0.0"

namespace relaydrop::core {

constexpr const char* VERSION = RELAYDROP_VERSION;

}
