#include "beamcalc/beam_spec.hpp"

namespace beamcalc {

std::string support_type_to_string(SupportType type) {
    switch (type) {
        case SupportType::SimplySupported: return "Simply Supported";
        case SupportType::Cantilever: return "Cantilever";
        default: return "Unknown";
    }
}

std::string load_type_to_string(LoadType type) {
    switch (type) {
        case LoadType::Point: return "Point Load";
        case LoadType::UniformlyDistributed: return "UDL";
        default: return "Unknown";
    }
}

} // namespace beamcalc
