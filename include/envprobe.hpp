#pragma once

#include "envprobe/capture.hpp"
#include "envprobe/config.hpp"
#include "envprobe/errors.hpp"
#include "envprobe/format.hpp"
#include "envprobe/script.hpp"
#include "envprobe/snapshot.hpp"
#include "envprobe/utils.hpp"
