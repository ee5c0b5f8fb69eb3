/**
 * @file StopWatch.hpp
 * @brief Named stop watches for run time recording
 * @author Keren Zhu
 * @date 10/02/2019
 */

#ifndef KLIB_STOP_WATCH_HPP_
#define KLIB_STOP_WATCH_HPP_

#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace klib
{
    class StopWatchMgr;

    /// @class klib::StopWatch
    /// @brief accumulate elapsed microseconds into a slot of StopWatchMgr
    class StopWatch
    {
        public:
            explicit StopWatch(std::uint32_t idx) : _idx(idx) {}
            /// @brief start (or resume) timing
            void start();
            /// @brief stop timing and accumulate the elapsed time
            void stop();
            /// @brief reset the accumulated time to zero
            void clear();
            /// @brief the accumulated time
            /// @return time in us
            std::uint64_t record() const;
        private:
            std::uint32_t _idx; ///< The slot in StopWatchMgr
            std::chrono::steady_clock::time_point _start;
    };

    /// @class klib::StopWatchMgr
    /// @brief the global registry of the named stop watches
    class StopWatchMgr
    {
        friend class StopWatch;
        public:
            /// @brief create a new stop watch bounded to a name. A name created twice refers to the latest one
            static std::shared_ptr<StopWatch> createNewStopWatch(const std::string &name);
            /// @brief get the time recorded by a named stop watch
            /// @return time in us. 0 if the name is unknown
            static std::uint64_t time(const std::string &name)
            {
                auto it = _nameToIdxMap.find(name);
                if (it == _nameToIdxMap.end() || _us.at(it->second) == std::numeric_limits<std::uint64_t>::max())
                {
                    return 0;
                }
                return _us.at(it->second);
            }
        private:
            static std::vector<std::uint64_t> _us;
            static std::unordered_map<std::string, std::uint32_t> _nameToIdxMap;
    };

    inline void StopWatch::start()
    {
        if (StopWatchMgr::_us.at(_idx) == std::numeric_limits<std::uint64_t>::max())
        {
            StopWatchMgr::_us.at(_idx) = 0;
        }
        _start = std::chrono::steady_clock::now();
    }

    inline void StopWatch::stop()
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - _start);
        StopWatchMgr::_us.at(_idx) += static_cast<std::uint64_t>(elapsed.count());
    }

    inline void StopWatch::clear()
    {
        StopWatchMgr::_us.at(_idx) = 0;
    }

    inline std::uint64_t StopWatch::record() const
    {
        return StopWatchMgr::_us.at(_idx);
    }
}

#define WATCH_CREATE_NEW(name) ::klib::StopWatchMgr::createNewStopWatch(name)
#define WATCH_LOOK_RECORD_TIME(name) ::klib::StopWatchMgr::time(name)

#endif /// KLIB_STOP_WATCH_HPP_
