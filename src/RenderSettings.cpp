#include "RenderSettings.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <thread>

bool RenderSettings::LoadFromFile(const std::string &path)
{
    using json = nlohmann::json;

    std::ifstream file(path);
    if (!file.is_open())
    {
        std::cerr << "[Settings] Could not open file for reading: " << path << std::endl;
        return false;
    }

    json j;
    try
    {
        file >> j;
    }
    catch (const json::parse_error &e)
    {
        std::cerr << "[Settings] Failed to parse JSON: " << e.what() << std::endl;
        return false;
    }

    if (!j.is_object())
    {
        std::cerr << "[Settings] Expected a JSON object in " << path << std::endl;
        return false;
    }

    RenderSettings loaded = *this;
    try
    {
        loaded.cullingMargin = j.value("cullingMargin", cullingMargin);
        loaded.defaultChunkSize = j.value("defaultChunkSize", defaultChunkSize);
        loaded.prepareThreads = j.value("prepareThreads", prepareThreads);
        loaded.enforceBoundsByDefault = j.value("enforceBoundsByDefault", enforceBoundsByDefault);
        loaded.verboseLogging = j.value("verboseLogging", verboseLogging);
    }
    catch (const json::type_error &e)
    {
        std::cerr << "[Settings] Wrong value type in " << path << ": " << e.what() << std::endl;
        return false;
    }

    if (loaded.defaultChunkSize <= 0)
    {
        std::cerr << "[Settings] defaultChunkSize must be positive, got " << loaded.defaultChunkSize << std::endl;
        return false;
    }
    if (loaded.cullingMargin < 0.0f)
    {
        std::cerr << "[Settings] cullingMargin must not be negative, got " << loaded.cullingMargin << std::endl;
        return false;
    }
    loaded.prepareThreads = std::max(0, loaded.prepareThreads);

    *this = loaded;
    std::cout << "[Settings] Loaded " << path << std::endl;
    return true;
}

bool RenderSettings::SaveToFile(const std::string &path) const
{
    using json = nlohmann::json;

    json j;
    j["cullingMargin"] = cullingMargin;
    j["defaultChunkSize"] = defaultChunkSize;
    j["prepareThreads"] = prepareThreads;
    j["enforceBoundsByDefault"] = enforceBoundsByDefault;
    j["verboseLogging"] = verboseLogging;

    std::ofstream file(path);
    if (!file.is_open())
    {
        std::cerr << "[Settings] Could not open file for writing: " << path << std::endl;
        return false;
    }

    file << j.dump(4);
    return file.good();
}

int RenderSettings::ResolvePrepareThreads() const
{
    if (prepareThreads > 0)
        return prepareThreads;
    unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<int>(hw);
}
