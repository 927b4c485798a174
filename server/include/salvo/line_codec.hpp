/*
 * 설명: 개행으로 구분되는 JSON 레코드와 Message 사이의 인코딩/디코딩 및 스트림 프레이밍을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/line_codec_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "salvo/message.hpp"

namespace salvo {

nlohmann::json ToJson(const Message& message);

// 개행 하나로 끝나는 프레임을 만든다. JSON 직렬화는 원시 개행을 포함하지 않는다.
std::string EncodeFrame(const Message& message);

// 실패 시 error_code는 malformed_message 또는 unknown_message_type 이다.
bool DecodeFrame(std::string_view frame, Message& out, std::string& error_code, std::string& error_message);

class LineFramer {
 public:
  explicit LineFramer(std::size_t max_frame_bytes);

  void Append(std::string_view bytes);
  std::optional<std::string> NextFrame();
  bool Overflowed() const { return overflowed_; }
  std::size_t PendingBytes() const { return buffer_.size(); }

 private:
  std::string buffer_;
  std::size_t max_frame_bytes_;
  bool overflowed_{false};
};

}  // namespace salvo
