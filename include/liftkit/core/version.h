#pragma once

namespace liftkit::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.2";

// kProducerName is written to the producer attribute of generated LIFT documents.
constexpr const char* kProducerName = "liftkit";

}  // namespace liftkit::core
