#include "WireCodec.hpp"
#include "task_message_generated.h"

#include <flatbuffers/flatbuffers.h>
#include <flatbuffers/flexbuffers.h>

#include <string>

namespace SysTask::Ipc {

namespace {

void write_value(flexbuffers::Builder& builder, const nlohmann::json& value) {
    using value_t = nlohmann::json::value_t;
    switch (value.type()) {
        case value_t::null:
            builder.Null();
            break;
        case value_t::boolean:
            builder.Bool(value.get<bool>());
            break;
        case value_t::number_integer:
            builder.Int(value.get<int64_t>());
            break;
        case value_t::number_unsigned:
            builder.UInt(value.get<uint64_t>());
            break;
        case value_t::number_float:
            builder.Double(value.get<double>());
            break;
        case value_t::string:
            builder.String(value.get_ref<const std::string&>());
            break;
        case value_t::array: {
            auto start = builder.StartVector();
            for (const auto& element : value) {
                write_value(builder, element);
            }
            builder.EndVector(start, false, false);
            break;
        }
        case value_t::object: {
            auto start = builder.StartMap();
            for (const auto& [key, element] : value.items()) {
                builder.Key(key);
                write_value(builder, element);
            }
            builder.EndMap(start);
            break;
        }
        case value_t::binary:
        case value_t::discarded:
        default:
            throw CodecError("WireCodec: unsupported JSON value type");
    }
}

nlohmann::json read_value(const flexbuffers::Reference& ref) {
    if (ref.IsNull()) return nullptr;
    if (ref.IsBool()) return ref.AsBool();
    if (ref.IsInt()) return ref.AsInt64();
    if (ref.IsUInt()) return ref.AsUInt64();
    if (ref.IsFloat()) return ref.AsDouble();
    if (ref.IsString()) return ref.AsString().str();
    if (ref.IsKey()) return std::string(ref.AsKey());
    // Maps are vectors too, so test for them first
    if (ref.IsMap()) {
        auto map = ref.AsMap();
        auto keys = map.Keys();
        auto values = map.Values();
        nlohmann::json out = nlohmann::json::object();
        for (size_t i = 0; i < keys.size(); ++i) {
            out[keys[i].AsKey()] = read_value(values[i]);
        }
        return out;
    }
    if (ref.IsVector()) {
        auto vec = ref.AsVector();
        nlohmann::json out = nlohmann::json::array();
        for (size_t i = 0; i < vec.size(); ++i) {
            out.push_back(read_value(vec[i]));
        }
        return out;
    }
    if (ref.IsTypedVector()) {
        auto vec = ref.AsTypedVector();
        nlohmann::json out = nlohmann::json::array();
        for (size_t i = 0; i < vec.size(); ++i) {
            out.push_back(read_value(vec[i]));
        }
        return out;
    }
    throw CodecError("WireCodec: unsupported FlexBuffer value type");
}

template <typename Vec>
std::span<const uint8_t> as_span(const Vec* vec) {
    if (!vec) return {};
    return {vec->data(), vec->size()};
}

std::string as_string(const flatbuffers::String* s) {
    return s ? s->str() : std::string{};
}

} // namespace

std::vector<uint8_t> WireCodec::to_flexbuffer(const nlohmann::json& value) {
    flexbuffers::Builder builder;
    write_value(builder, value);
    builder.Finish();
    return builder.GetBuffer();
}

nlohmann::json WireCodec::from_flexbuffer(std::span<const uint8_t> bytes) {
    if (bytes.empty()) return nullptr;
    if (!flexbuffers::VerifyBuffer(bytes.data(), bytes.size())) {
        throw CodecError("WireCodec: malformed FlexBuffer value");
    }
    return read_value(flexbuffers::GetRoot(bytes.data(), bytes.size()));
}

std::vector<uint8_t> WireCodec::encode(const Message& message) {
    flatbuffers::FlatBufferBuilder fbb(256);
    flatbuffers::Offset<Wire::Envelope> envelope;

    if (const auto* m = std::get_if<ExecuteTaskMessage>(&message)) {
        auto id = fbb.CreateString(m->task_id);
        auto name = fbb.CreateString(m->task_name);
        auto args = fbb.CreateVector(to_flexbuffer(m->args.is_null() ? nlohmann::json::array() : m->args));
        auto body = Wire::CreateExecuteTask(fbb, id, name, args);
        envelope = Wire::CreateEnvelope(fbb, Wire::Payload_ExecuteTask, body.Union());
    } else if (const auto* m = std::get_if<TaskCompleteMessage>(&message)) {
        auto id = fbb.CreateString(m->task_id);
        auto result = fbb.CreateVector(to_flexbuffer(m->result));
        auto body = Wire::CreateTaskComplete(fbb, id, result);
        envelope = Wire::CreateEnvelope(fbb, Wire::Payload_TaskComplete, body.Union());
    } else if (const auto* m = std::get_if<TaskErrorMessage>(&message)) {
        auto id = fbb.CreateString(m->task_id);
        auto error = fbb.CreateString(m->error);
        auto body = Wire::CreateTaskFailed(fbb, id, error, m->code);
        envelope = Wire::CreateEnvelope(fbb, Wire::Payload_TaskFailed, body.Union());
    } else {
        const auto& ready = std::get<WorkerReadyMessage>(message);
        auto tasks = fbb.CreateVectorOfStrings(ready.tasks);
        auto body = Wire::CreateWorkerReady(fbb, ready.pid, tasks);
        envelope = Wire::CreateEnvelope(fbb, Wire::Payload_WorkerReady, body.Union());
    }

    Wire::FinishEnvelopeBuffer(fbb, envelope);
    return std::vector<uint8_t>(fbb.GetBufferPointer(), fbb.GetBufferPointer() + fbb.GetSize());
}

Message WireCodec::decode(std::span<const uint8_t> body) {
    flatbuffers::Verifier verifier(body.data(), body.size());
    if (body.empty() || !Wire::VerifyEnvelopeBuffer(verifier)) {
        throw CodecError("WireCodec: frame failed verification (" + std::to_string(body.size()) + " bytes)");
    }
    const auto* envelope = Wire::GetEnvelope(body.data());

    switch (envelope->payload_type()) {
        case Wire::Payload_ExecuteTask: {
            const auto* m = envelope->payload_as_ExecuteTask();
            ExecuteTaskMessage out;
            out.task_id = as_string(m->task_id());
            out.task_name = as_string(m->task_name());
            out.args = from_flexbuffer(as_span(m->args()));
            if (out.args.is_null()) out.args = nlohmann::json::array();
            return out;
        }
        case Wire::Payload_TaskComplete: {
            const auto* m = envelope->payload_as_TaskComplete();
            return TaskCompleteMessage{as_string(m->task_id()), from_flexbuffer(as_span(m->result()))};
        }
        case Wire::Payload_TaskFailed: {
            const auto* m = envelope->payload_as_TaskFailed();
            return TaskErrorMessage{as_string(m->task_id()), as_string(m->error()), m->code()};
        }
        case Wire::Payload_WorkerReady: {
            const auto* m = envelope->payload_as_WorkerReady();
            WorkerReadyMessage out;
            out.pid = m->pid();
            if (m->tasks()) {
                for (const auto* name : *m->tasks()) {
                    out.tasks.push_back(as_string(name));
                }
            }
            return out;
        }
        default:
            throw CodecError("WireCodec: envelope has no payload");
    }
}

} // namespace SysTask::Ipc
