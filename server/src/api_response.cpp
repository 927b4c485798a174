/*
 * 설명: 운영 HTTP 응답 엔벨로프를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "salvo/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace salvo {
namespace {

std::string UtcTimestamp() {
  const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%FT%TZ");
  return out.str();
}

nlohmann::json BuildEnvelope(bool success, nlohmann::json data, nlohmann::json error) {
  return {{"success", success},
          {"data", std::move(data)},
          {"error", std::move(error)},
          {"meta", {{"timestamp", UtcTimestamp()}, {"service", "salvo"}}}};
}

}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) { return BuildEnvelope(true, data, nullptr); }

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  return BuildEnvelope(false, nullptr, {{"code", code}, {"message", message}, {"detail", detail}});
}

}  // namespace salvo
