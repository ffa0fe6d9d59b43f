#ifndef INCLUDED_STOPWATCH
#define INCLUDED_STOPWATCH

#include <chrono>
#include <iomanip>
#include <iostream>

#ifndef DEBUG_OSTREAM
#define DEBUG_OSTREAM std::clog
#endif

namespace utility::timing
{

class stopwatch
{
    using clock_type = std::chrono::steady_clock;

public:
    stopwatch(const char* func = "Process") :
        function_name_{ func },
        start_{ clock_type::now() }
    {
    }

    stopwatch(stopwatch const&)                    = delete;
    stopwatch(stopwatch&&)                         = delete;
    auto operator=(stopwatch const&) -> stopwatch& = delete;
    auto operator=(stopwatch&&) -> stopwatch&      = delete;

    [[nodiscard]]
    auto elapsed() const noexcept -> std::chrono::microseconds
    {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            clock_type::now() - start_
        );
    }

    ~stopwatch()
    {
        const auto duration = elapsed();
        DEBUG_OSTREAM
            << function_name_ << " took "
            << std::chrono::duration_cast<std::chrono::milliseconds>(duration).count()
            << "ms\t (" << duration.count() << "us)\n";
    }

private:
    const char*                  function_name_{};
    const clock_type::time_point start_{};
};

} // namespace utility::timing

#endif // INCLUDED_STOPWATCH
