#include <healthcam/core/session_result.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace healthcam::core {

std::string make_timestamp() {
  const std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream out;
  out << std::put_time(&local, "%Y%m%d_%H%M%S");
  return out.str();
}

}  // namespace healthcam::core
