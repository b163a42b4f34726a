//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// `Content-Length` framed JSON message codec.
///
/// Encoding produces `Content-Length: N\r\n\r\n` followed by exactly N bytes of
/// compact JSON. Decoding is incremental: bytes are fed as they arrive and whole
/// messages are pulled out one at a time. The codec does no I/O.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBROKER_LSP_WIRE_CODEC_H
#define LSPBROKER_LSP_WIRE_CODEC_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <string>

namespace lspbroker::lsp
{

/// @brief Largest header block accepted before the blank-line terminator.
inline constexpr std::size_t MaxHeaderBytes = 8U * 1024U;

/// @brief Default upper bound on a single message body.
inline constexpr std::size_t DefaultMaxMessageBytes = 64U * 1024U * 1024U;

/// @brief Serializes a JSON value compactly. Object keys are emitted sorted.
/// @param[in] value JSON value.
/// @return Compact JSON text.
[[nodiscard]] std::string serializeJson(const llvm::json::Value& value);

/// @brief Encodes one framed message.
/// @param[in] message JSON-RPC message.
/// @return Header plus body, with nothing after the body.
[[nodiscard]] std::string encodeMessage(const llvm::json::Value& message);

/// @brief Outcome of one decode step.
enum class DecodeStatus
{
    /// @brief No complete message is buffered yet.
    NeedMore,

    /// @brief One message was decoded.
    Message,

    /// @brief The stream is corrupt; no further messages will be produced.
    Fault,
};

/// @brief Incremental decoder for a single framed byte stream.
class FrameDecoder final
{
public:
    /// @brief Creates a decoder.
    /// @param[in] maxMessageBytes Largest body length accepted.
    explicit FrameDecoder(std::size_t maxMessageBytes = DefaultMaxMessageBytes);

    /// @brief Appends received bytes. Ignored once the decoder has faulted.
    /// @param[in] bytes Raw bytes, possibly splitting headers or bodies.
    void feed(llvm::StringRef bytes);

    /// @brief Extracts the next complete message.
    /// @param[out] message Decoded message when `DecodeStatus::Message` is returned.
    /// @return Decode outcome. A fault is sticky.
    [[nodiscard]] DecodeStatus next(llvm::json::Value& message);

    /// @brief Returns whether a framing fault was detected.
    [[nodiscard]] bool faulted() const;

    /// @brief Returns the reason for the framing fault, empty when healthy.
    [[nodiscard]] const std::string& faultReason() const;

    /// @brief Returns the number of buffered bytes not yet consumed.
    [[nodiscard]] std::size_t bufferedBytes() const;

private:
    DecodeStatus fail(std::string reason);
    void         compact();

    std::size_t maxMessageBytes_;
    std::string buffer_;
    std::size_t consumed_{0};
    std::string faultReason_;
    bool        faulted_{false};
};

}  // namespace lspbroker::lsp

#endif  // LSPBROKER_LSP_WIRE_CODEC_H
