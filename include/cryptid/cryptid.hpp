#pragma once

#include "cryptid/codec.hpp"
#include "cryptid/config.hpp"
#include "cryptid/constants.hpp"
#include "cryptid/error.hpp"
#include "cryptid/registry.hpp"
#include "cryptid/typed_id.hpp"
