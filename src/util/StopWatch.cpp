#include "StopWatch.hpp"

namespace klib
{
    std::vector<std::uint64_t> StopWatchMgr::_us = std::vector<std::uint64_t>(1, 0);
    std::unordered_map<std::string, std::uint32_t> StopWatchMgr::_nameToIdxMap;

    std::shared_ptr<StopWatch> StopWatchMgr::createNewStopWatch(const std::string &name)
    {
        auto it = _nameToIdxMap.find(name);
        if (it != _nameToIdxMap.end())
        {
            // Restart the slot of a re-created watch
            _us.at(it->second) = std::numeric_limits<std::uint64_t>::max();
            return std::make_shared<StopWatch>(it->second);
        }
        auto idx = static_cast<std::uint32_t>(_us.size());
        _us.emplace_back(std::numeric_limits<std::uint64_t>::max());
        _nameToIdxMap[name] = idx;
        return std::make_shared<StopWatch>(idx);
    }
}
