#include<cstring>
#include<fstream>
#include<iterator>
#include<limits>

#include<doctest/doctest.h>

#include"../include/Blob.hpp"

namespace SimpleRL
{
    namespace
    {
        struct DtypeEntry
        {
            const char *name;
            torch::Dtype dtype;
        };

        const DtypeEntry dtypeTable[] = {
            {"float32", torch::kFloat},
            {"float64", torch::kDouble},
            {"int64", torch::kLong},
            {"int32", torch::kInt},
            {"uint8", torch::kByte},
            {"bool", torch::kBool},
        };
    }

    std::string Blob::toBytes() const
    {
        msgpack::sbuffer buffer;
        msgpack::pack(buffer, *this);
        return std::string(buffer.data(), buffer.size());
    }

    Blob Blob::fromBytes(const std::string &bytes)
    {
        Blob blob;
        try
        {
            msgpack::object_handle objectHandle = msgpack::unpack(bytes.data(), bytes.size());
            objectHandle.get().convert(blob);
        }
        catch (const std::exception &e)
        {
            throw IncompatibleRestoreError(std::string("Bytes are not a Blob: ") + e.what());
        }
        return blob;
    }

    /**
     * @brief Converts a tensor to its msgpack form.
     *
     * The tensor is moved to the CPU and made contiguous first. An undefined tensor
     * is encoded with dtype "undefined" and decodes back to an undefined tensor.
     */
    TensorData encodeTensor(const torch::Tensor &tensor)
    {
        TensorData data;
        if (!tensor.defined())
        {
            data.dtype = "undefined";
            return data;
        }

        auto cpu = tensor.to(torch::kCPU).contiguous();
        for (const auto &entry : dtypeTable)
        {
            if (entry.dtype == cpu.scalar_type())
            {
                data.dtype = entry.name;
                break;
            }
        }
        if (data.dtype.empty())
        {
            throw std::invalid_argument(std::string("Unsupported tensor dtype ") + c10::toString(cpu.scalar_type()));
        }

        data.shape = cpu.sizes().vec();
        const auto numBytes = static_cast<size_t>(cpu.numel()) * cpu.element_size();
        const char *begin = static_cast<const char *>(cpu.data_ptr());
        data.data.assign(begin, begin + numBytes);
        return data;
    }

    torch::Tensor decodeTensor(const TensorData &data)
    {
        if (data.dtype == "undefined")
        {
            return torch::Tensor();
        }

        for (const auto &entry : dtypeTable)
        {
            if (data.dtype != entry.name)
            {
                continue;
            }
            // Checked before allocating, a corrupted shape must not reach torch::empty.
            size_t numBytes = c10::elementSize(entry.dtype);
            for (auto dimension : data.shape)
            {
                if (dimension < 0)
                {
                    throw IncompatibleRestoreError("Tensor shape has negative dimension " + std::to_string(dimension));
                }
                const auto size = static_cast<size_t>(dimension);
                if (size != 0 && numBytes > std::numeric_limits<size_t>::max() / size)
                {
                    throw IncompatibleRestoreError("Tensor shape is too large");
                }
                numBytes *= size;
            }
            if (numBytes != data.data.size())
            {
                throw IncompatibleRestoreError("Tensor payload holds " + std::to_string(data.data.size()) +
                                               " bytes, shape requires " + std::to_string(numBytes));
            }
            auto tensor = torch::empty(data.shape, torch::TensorOptions().dtype(entry.dtype));
            if (numBytes > 0)
            {
                std::memcpy(tensor.data_ptr(), data.data.data(), numBytes);
            }
            return tensor;
        }
        throw IncompatibleRestoreError("Unknown tensor dtype '" + data.dtype + "'");
    }

    void writeBlobFile(const std::string &path, const Blob &blob)
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            throw std::runtime_error("Cannot open '" + path + "' for writing");
        }
        const auto bytes = blob.toBytes();
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!file)
        {
            throw std::runtime_error("Failed writing '" + path + "'");
        }
    }

    Blob readBlobFile(const std::string &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            throw std::runtime_error("Cannot open '" + path + "' for reading");
        }
        std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return Blob::fromBytes(bytes);
    }

    namespace
    {
        struct Counter
        {
            int value = 0;
            std::string label;
            MSGPACK_DEFINE_MAP(value, label);
        };
    }

    TEST_CASE("Blob")
    {
        SUBCASE("Survives the wire form")
        {
            Counter counter{7, "seven"};
            auto blob = packBlob("Counter", 2, counter);
            blob.sequence = 11;

            auto received = Blob::fromBytes(blob.toBytes());
            CHECK(received.typeTag == "Counter");
            CHECK(received.version == 2);
            CHECK(received.sequence == 11);

            auto decoded = unpackBlob<Counter>(received, "Counter", 2);
            CHECK(decoded.value == 7);
            CHECK(decoded.label == "seven");
        }

        SUBCASE("Rejects a foreign type tag")
        {
            auto blob = packBlob("Counter", 1, Counter{});
            CHECK_THROWS_AS(unpackBlob<Counter>(blob, "Other", 1), IncompatibleRestoreError);
        }

        SUBCASE("Rejects a different version")
        {
            auto blob = packBlob("Counter", 1, Counter{});
            CHECK_THROWS_AS(unpackBlob<Counter>(blob, "Counter", 2), IncompatibleRestoreError);
        }

        SUBCASE("Rejects a corrupted payload")
        {
            auto blob = packBlob("Counter", 1, std::string("not a counter"));
            CHECK_THROWS_AS(unpackBlob<Counter>(blob, "Counter", 1), IncompatibleRestoreError);
        }

        SUBCASE("Rejects garbage bytes")
        {
            CHECK_THROWS_AS(Blob::fromBytes(std::string("\xc1\xc1\xc1", 3)), IncompatibleRestoreError);
        }
    }

    TEST_CASE("TensorData")
    {
        SUBCASE("Float tensors keep shape and values")
        {
            auto tensor = torch::rand({3, 2});
            auto decoded = decodeTensor(encodeTensor(tensor));
            CHECK(decoded.sizes().vec() == std::vector<int64_t>{3, 2});
            CHECK(torch::equal(decoded, tensor));
        }

        SUBCASE("Long scalars keep dtype")
        {
            auto tensor = torch::tensor(int64_t{42});
            auto decoded = decodeTensor(encodeTensor(tensor));
            CHECK(decoded.scalar_type() == torch::kLong);
            CHECK(decoded.dim() == 0);
            CHECK(decoded.item<int64_t>() == 42);
        }

        SUBCASE("Undefined tensors round trip")
        {
            CHECK(!decodeTensor(encodeTensor(torch::Tensor())).defined());
        }

        SUBCASE("Size mismatch is rejected")
        {
            auto data = encodeTensor(torch::zeros({4}));
            data.data.pop_back();
            CHECK_THROWS_AS(decodeTensor(data), IncompatibleRestoreError);
        }

        SUBCASE("Corrupted shapes are rejected before allocating")
        {
            auto data = encodeTensor(torch::zeros({2, 2}));
            data.shape = {-2, -2};
            CHECK_THROWS_AS(decodeTensor(data), IncompatibleRestoreError);
            data.shape = {std::numeric_limits<int64_t>::max(), std::numeric_limits<int64_t>::max()};
            CHECK_THROWS_AS(decodeTensor(data), IncompatibleRestoreError);
            data.shape = {0, std::numeric_limits<int64_t>::max()};
            CHECK_THROWS_AS(decodeTensor(data), IncompatibleRestoreError);
        }
    }
}
