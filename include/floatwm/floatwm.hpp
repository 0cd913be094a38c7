#pragma once

#include "priv/common.hpp"

#include "priv/surface.hpp"
#include "priv/geometry.hpp"
#include "priv/stacking.hpp"
#include "priv/configuration.hpp"

#include "priv/window.hpp"
#include "priv/window-behaviors.hpp"
#include "priv/window-manager.hpp"
