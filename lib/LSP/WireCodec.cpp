//===----------------------------------------------------------------------===//
//
// Part of the lspbroker project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framing and incremental decoding.
///
//===----------------------------------------------------------------------===//

#include "lspbroker/LSP/WireCodec.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/raw_ostream.h"

#include <limits>
#include <optional>
#include <utility>

namespace lspbroker::lsp
{
namespace
{

constexpr llvm::StringRef HeaderTerminator = "\r\n\r\n";

/// Digits only; no sign, no whitespace inside the number.
std::optional<std::size_t> parseContentLengthValue(llvm::StringRef text)
{
    text = text.trim();
    if (text.empty())
    {
        return std::nullopt;
    }
    std::size_t value = 0;
    for (const char ch : text)
    {
        if (ch < '0' || ch > '9')
        {
            return std::nullopt;
        }
        const auto digit = static_cast<std::size_t>(ch - '0');
        if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10U)
        {
            return std::nullopt;
        }
        value = value * 10U + digit;
    }
    return value;
}

}  // namespace

std::string serializeJson(const llvm::json::Value& value)
{
    std::string              text;
    llvm::raw_string_ostream stream(text);
    stream << value;
    stream.flush();
    return text;
}

std::string encodeMessage(const llvm::json::Value& message)
{
    const std::string body = serializeJson(message);
    std::string       out  = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    out.append(body);
    return out;
}

FrameDecoder::FrameDecoder(const std::size_t maxMessageBytes)
    : maxMessageBytes_(maxMessageBytes)
{
}

void FrameDecoder::feed(const llvm::StringRef bytes)
{
    if (faulted_)
    {
        return;
    }
    buffer_.append(bytes.data(), bytes.size());
}

DecodeStatus FrameDecoder::next(llvm::json::Value& message)
{
    if (faulted_)
    {
        return DecodeStatus::Fault;
    }

    const llvm::StringRef pending = llvm::StringRef(buffer_).drop_front(consumed_);
    const std::size_t     headerEnd = pending.find(HeaderTerminator);
    if (headerEnd == llvm::StringRef::npos)
    {
        if (pending.size() > MaxHeaderBytes)
        {
            return fail("header block exceeds " + std::to_string(MaxHeaderBytes) + " bytes");
        }
        return DecodeStatus::NeedMore;
    }
    if (headerEnd > MaxHeaderBytes)
    {
        return fail("header block exceeds " + std::to_string(MaxHeaderBytes) + " bytes");
    }

    llvm::SmallVector<llvm::StringRef, 4> lines;
    pending.take_front(headerEnd).split(lines, "\r\n");

    std::optional<std::size_t> contentLength;
    for (const llvm::StringRef line : lines)
    {
        const auto [name, value] = line.split(':');
        if (name.size() == line.size())
        {
            return fail("malformed header line '" + line.str() + "'");
        }
        if (!name.trim().equals_insensitive("Content-Length"))
        {
            continue;
        }
        contentLength = parseContentLengthValue(value);
        if (!contentLength)
        {
            return fail("invalid Content-Length value '" + value.trim().str() + "'");
        }
    }

    if (!contentLength)
    {
        return fail("missing Content-Length header");
    }
    if (*contentLength > maxMessageBytes_)
    {
        return fail("message of " + std::to_string(*contentLength) + " bytes exceeds limit of " +
                    std::to_string(maxMessageBytes_));
    }

    const std::size_t bodyStart = headerEnd + HeaderTerminator.size();
    if (pending.size() - bodyStart < *contentLength)
    {
        return DecodeStatus::NeedMore;
    }

    const llvm::StringRef             body   = pending.substr(bodyStart, *contentLength);
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(body);
    if (!parsed)
    {
        return fail("invalid JSON payload: " + llvm::toString(parsed.takeError()));
    }

    consumed_ += bodyStart + *contentLength;
    compact();
    message = std::move(*parsed);
    return DecodeStatus::Message;
}

bool FrameDecoder::faulted() const
{
    return faulted_;
}

const std::string& FrameDecoder::faultReason() const
{
    return faultReason_;
}

std::size_t FrameDecoder::bufferedBytes() const
{
    return buffer_.size() - consumed_;
}

DecodeStatus FrameDecoder::fail(std::string reason)
{
    faulted_     = true;
    faultReason_ = std::move(reason);
    buffer_.clear();
    consumed_ = 0;
    return DecodeStatus::Fault;
}

void FrameDecoder::compact()
{
    if (consumed_ == buffer_.size())
    {
        buffer_.clear();
        consumed_ = 0;
        return;
    }
    if (consumed_ > buffer_.size() / 2U)
    {
        buffer_.erase(0, consumed_);
        consumed_ = 0;
    }
}

}  // namespace lspbroker::lsp
