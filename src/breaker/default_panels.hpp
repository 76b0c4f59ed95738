#pragma once

/**
 * FUSE Default Loadout
 * The five stock panels and their circuits
 *
 *   1 ai-agents      6 circuits
 *   2 repositories   1 circuit
 *   3 integrations   5 circuits
 *   4 voice          4 circuits
 *   5 deployment     5 circuits
 */

#include <cstddef>

namespace fuse {
namespace breaker {

class BreakerRegistry;

/**
 * Register the stock panels (all Off)
 * @return number of circuits registered; ids already present are skipped
 */
size_t load_default_panels(BreakerRegistry& registry);

} // namespace breaker
} // namespace fuse
