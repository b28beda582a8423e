/// @file port.cpp
/// @brief Port enum names

#include "state/port.hpp"

namespace tachy {

std::string_view port_flow_name(PortFlow flow) {
    switch (flow) {
    case PortFlow::SOURCE:
        return "Source";
    case PortFlow::SINK:
        return "Sink";
    }
    return "Unknown";
}

std::string_view port_color_name(PortColor color) {
    switch (color) {
    case PortColor::BEHAVIOR:
        return "Behavior";
    case PortColor::EVENT:
        return "Event";
    case PortColor::ANALOG:
        return "Analog";
    }
    return "Unknown";
}

} // namespace tachy
