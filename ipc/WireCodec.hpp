/**
 * \file ipc/WireCodec.hpp
 * \brief FlatBuffers encoding of channel messages.
 * \details Frame bodies are `Envelope` tables from task_message.fbs. JSON values
 * (task args and results) travel as nested FlexBuffers.
 */
#pragma once

#include "TaskMessage.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace SysTask::Ipc {

/** \brief Raised for bodies that fail verification or carry unsupported values. */
class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class WireCodec {
public:
    /** \brief Serialize a message into a frame body. \throws CodecError */
    [[nodiscard]] static std::vector<uint8_t> encode(const Message& message);

    /** \brief Verify and decode a frame body. \throws CodecError */
    [[nodiscard]] static Message decode(std::span<const uint8_t> body);

    /** \brief JSON -> FlexBuffer bytes. \throws CodecError for binary/discarded values */
    [[nodiscard]] static std::vector<uint8_t> to_flexbuffer(const nlohmann::json& value);

    /** \brief FlexBuffer bytes -> JSON. An empty buffer yields null. \throws CodecError */
    [[nodiscard]] static nlohmann::json from_flexbuffer(std::span<const uint8_t> bytes);
};

} // namespace SysTask::Ipc
