#include <fastedge/log/log.hpp>

#include <chrono>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/sinks/ConsoleSink.h>

namespace fastedge::log {

void initialize() noexcept
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  quill::BackendOptions options;
  options.sleep_duration = sleep_duration;
  options.error_notifier = []( const std::string& err ) noexcept
  {
    LOG_ERROR( fastedge::log::instance(), "Encountered backend logging error: {}", err );
  };

  quill::Backend::start( options );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "fastedge",
    frontend::create_or_get_sink< quill::ConsoleSink >( "fastedge_console_sink" ),
    quill::PatternFormatterOptions{ "%(time) %(short_source_location:<28) %(log_level_short_code:<2) %(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

} // namespace fastedge::log
