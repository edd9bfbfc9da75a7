#pragma once

#include "bytelocker/config.hpp"
#include "bytelocker/crypto/random.hpp"
#include "bytelocker/crypto/secretbox.hpp"
#include "bytelocker/errors.hpp"
#include "bytelocker/gated.hpp"
#include "bytelocker/guarded_buffer.hpp"
#include "bytelocker/memory/guarded_region.hpp"
#include "bytelocker/memory/wipe.hpp"
#include "bytelocker/utils/common.hpp"
