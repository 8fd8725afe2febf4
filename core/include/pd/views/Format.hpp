#pragma once
#include <string>

namespace pd {

// "$67,123.45", "$3.14", "$0.0123", "$0.000012"
std::string formatPrice(double price);

// "$67k", "$150", "$0.42"
std::string formatPriceShort(double price);

// Signed percent: "+1.23%", "-0.50%"
std::string formatChange(double changePercent);

// Quote-currency volume: "$1.2B", "$350M", "$12K", "$900"
std::string formatVolume(double volumeUsd);

} // namespace pd
