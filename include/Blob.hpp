#pragma once

#ifndef SIMPLERL_BLOB_HPP
#define SIMPLERL_BLOB_HPP

#include<cstdint>
#include<string>
#include<vector>

#include<msgpack.hpp>
#include<torch/torch.h>

#include"Errors.hpp"

namespace SimpleRL
{
    /**
     * @struct Blob
     * @brief Opaque, versioned, self-describing snapshot produced by backup().
     *
     * The payload format belongs to the concrete type that produced it. The
     * framework only looks at the header: `typeTag` and `version` are checked by
     * the restoring side, `sequence` orders successive snapshots of the same
     * object (parameter mailboxes keep the highest one).
     */
    struct Blob
    {
        std::string typeTag;      ///< Producer identity, e.g. "QL/Parameter"
        uint32_t version = 0;     ///< Payload layout version of the producer
        uint64_t sequence = 0;    ///< Monotonic stamp set by the sender, 0 if unused
        std::vector<char> payload;///< Producer-defined bytes

        /** @return msgpack wire form, safe to write to disk or a socket */
        std::string toBytes() const;

        /**
         * @brief Parses the wire form produced by toBytes().
         * @throws IncompatibleRestoreError if the bytes are not a Blob
         */
        static Blob fromBytes(const std::string &bytes);

        MSGPACK_DEFINE_MAP(typeTag, version, sequence, payload);
    };

    /**
     * @brief Uniform state-transfer contract of every stateful component.
     *
     * Protocol: call backup() before transport, call restore() exactly once on the
     * receiving side before first use. restore() is all-or-nothing: on any error the
     * object keeps its previous state.
     */
    class Checkpointable
    {
    public:
        virtual ~Checkpointable() = default;

        virtual Blob backup() const = 0;

        virtual void restore(const Blob &blob) = 0;
    };

    /**
     * @struct TensorData
     * @brief msgpack form of a CPU tensor (dtype name, shape, raw bytes).
     */
    struct TensorData
    {
        std::string dtype;
        std::vector<int64_t> shape;
        std::vector<char> data;
        MSGPACK_DEFINE_MAP(dtype, shape, data);
    };

    TensorData encodeTensor(const torch::Tensor &tensor);

    /** @throws IncompatibleRestoreError on unknown dtype or size mismatch */
    torch::Tensor decodeTensor(const TensorData &data);

    /** @brief Serializes `value` with msgpack and wraps it in a Blob header. */
    template<typename T>
    Blob packBlob(const std::string &typeTag, uint32_t version, const T &value)
    {
        msgpack::sbuffer buffer;
        msgpack::pack(buffer, value);

        Blob blob;
        blob.typeTag = typeTag;
        blob.version = version;
        blob.payload.assign(buffer.data(), buffer.data() + buffer.size());
        return blob;
    }

    /**
     * @brief Checks the Blob header and decodes the payload.
     *
     * Nothing is mutated here, so callers decode first and commit afterwards to keep
     * restore() all-or-nothing.
     *
     * @throws IncompatibleRestoreError on tag/version mismatch or undecodable payload
     */
    template<typename T>
    T unpackBlob(const Blob &blob, const std::string &typeTag, uint32_t version)
    {
        if (blob.typeTag != typeTag)
        {
            throw IncompatibleRestoreError("Blob type '" + blob.typeTag + "' cannot restore '" + typeTag + "'");
        }
        if (blob.version != version)
        {
            throw IncompatibleRestoreError("Blob version " + std::to_string(blob.version) + " of '" + typeTag +
                                           "' does not match expected version " + std::to_string(version));
        }

        T value;
        try
        {
            msgpack::object_handle objectHandle = msgpack::unpack(blob.payload.data(), blob.payload.size());
            objectHandle.get().convert(value);
        }
        catch (const std::exception &e)
        {
            throw IncompatibleRestoreError("Corrupted '" + typeTag + "' payload: " + e.what());
        }
        return value;
    }

    void writeBlobFile(const std::string &path, const Blob &blob);

    Blob readBlobFile(const std::string &path);
}

#endif //SIMPLERL_BLOB_HPP
