#pragma once

#include "address.hpp"
#include "collection_config.hpp"
#include "errors.hpp"
#include "error_formatting.hpp"
#include "data_uri.hpp"
#include "metadata.hpp"
#include "registry.hpp"
#include "sha3_seed_mixer.hpp"
#include "stat_advancement.hpp"
#include "svg_renderer.hpp"
