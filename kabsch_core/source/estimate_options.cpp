#include "kabsch/estimate_options.h"

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include <yaml-cpp/yaml.h>

auto kabsch::estimate_options::parse_yaml(const YAML::Node& node) -> estimate_options
{
    estimate_options options;

    if (!node || !node.IsMap())
        return options;

    try
    {
        if (const auto x = node["estimate_scale"]) options.estimate_scale = x.as<bool>();
        if (const auto x = node["rank_tolerance"]) options.rank_tolerance = x.as<double>();
    }
    catch (const YAML::Exception& e)
    {
        SPDLOG_ERROR("Error parsing estimate options from YAML: {}", e.what());
        throw std::runtime_error(std::string("estimate options: ") + e.what());
    }

    return options;
}

void kabsch::estimate_options::print() const
{
    SPDLOG_INFO("estimate_scale: {}", estimate_scale);
    SPDLOG_INFO("rank_tolerance: {}", rank_tolerance);
}

void kabsch::estimate_options::validate() const
{
    if (rank_tolerance < 0.0) throw std::invalid_argument("rank_tolerance must be >= 0");
}
