#pragma once

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "io.hpp"
#include "json_writer.hpp"
#include "options.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"

namespace ChainBattles {

enum class SerializeError {
    NO_ERROR,
    WRITER_ERROR
};

constexpr std::string_view error_to_string(SerializeError e) {
    switch(e) {
    case SerializeError::NO_ERROR: return "NO_ERROR"; break;
    case SerializeError::WRITER_ERROR: return "WRITER_ERROR"; break;
    }
    return "N/A";
}

template <CharOutputIterator OutIter, class WriterError>
class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    WriterError m_writerError{};
    OutIter m_pos;
public:
    constexpr SerializeResult(SerializeError err, WriterError werr, OutIter pos):
        m_error(err), m_writerError(werr), m_pos(pos)
    {}
    constexpr operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    constexpr OutIter pos() const {
        return m_pos;
    }
    constexpr SerializeError error() const {
        return m_error;
    }
    constexpr WriterError writerError() const {
        return m_writerError;
    }
};

namespace serializer_details {

template <CharOutputIterator OutIter, class WriterError>
class SerializationContext {
    SerializeError m_error = SerializeError::NO_ERROR;
    WriterError m_writerError{};
    OutIter m_pos;

public:
    constexpr explicit SerializationContext(OutIter it): m_pos(it) {}

    template<class Writer>
    constexpr bool withWriterError(Writer & writer) {
        m_error = SerializeError::WRITER_ERROR;
        m_writerError = writer.getError();
        m_pos = writer.current();
        return false;
    }

    template<class Writer>
    constexpr void finish(Writer & writer) {
        m_pos = writer.current();
    }

    constexpr SerializeResult<OutIter, WriterError> result() const {
        return SerializeResult<OutIter, WriterError>(m_error, m_writerError, m_pos);
    }
};

template <class FieldOptions, static_schema::JsonSerializableValue Field, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const Field & obj, Writer & writer, CTX &ctx);

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonBool<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    if(!writer.write_bool(obj)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonNumber<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if(!writer.write_number(obj)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonString<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if(!writer.write_string(obj.data(), obj.size())) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonSerializableArray<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    typename Writer::ArrayFrame fr;
    if(!writer.write_array_begin(fr)) {
        return ctx.withWriterError(writer);
    }

    bool first = true;
    for(const auto & element : obj) {
        if(!first) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        first = false;

        using Meta = options::detail::annotation_meta_getter<decltype(element)>;
        if(!SerializeValue<typename Meta::options>(element, writer, ctx)) {
            return false;
        }
    }

    if(!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <bool SkipNulls, std::size_t StructIndex, class Frame, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeOneStructField(std::size_t & count, Frame & fr, const ObjT& structObj, Writer & writer, CTX &ctx) {
    using Field     = introspection::structureElementTypeByIndex<StructIndex, ObjT>;
    using FieldOpts = typename options::detail::annotation_meta_getter<Field>::options;

    if constexpr (FieldOpts::template has_option<options::detail::not_json_tag>) {
        return true;
    } else {
        const auto & value = introspection::getStructElementByIndex<StructIndex>(structObj);

        if constexpr(static_schema::JsonNullableSerializableValue<Field> && SkipNulls) {
            if(static_schema::isNull(value)) {
                return true;
            }
        }
        if(count > 0) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }

        std::string_view key;
        if constexpr (FieldOpts::template has_option<options::detail::key_tag>) {
            using KeyOpt = typename FieldOpts::template get_option<options::detail::key_tag>;
            key = KeyOpt::desc.toStringView();
        } else {
            key = introspection::structureElementNameByIndex<StructIndex, ObjT>;
        }
        if(!writer.write_string(key.data(), key.size())) {
            return ctx.withWriterError(writer);
        }
        if(!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }

        count ++;
        return SerializeValue<FieldOpts>(value, writer, ctx);
    }
}

template <bool SkipNulls, class Frame, class ObjT, writer::WriterLike Writer, class CTX, std::size_t... StructIndex>
constexpr bool SerializeStructFields(Frame &fr, const ObjT& structObj, Writer & writer, CTX &ctx, std::index_sequence<StructIndex...>) {
    std::size_t count = 0;
    return (
        SerializeOneStructField<SkipNulls, StructIndex>(count, fr, structObj, writer, ctx)
        && ...
        );
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::JsonObject<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    typename Writer::MapFrame fr;
    if(!writer.write_map_begin(fr)) {
        return ctx.withWriterError(writer);
    }

    if(!SerializeStructFields<Opts::template has_option<options::detail::skip_nulls_tag>>(
            fr, obj, writer, ctx, std::make_index_sequence<introspection::structureElementsCount<ObjT>>{}))
        return false;

    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class FieldOptions, static_schema::JsonSerializableValue Field, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const Field & obj, Writer & writer, CTX &ctx) {
    if constexpr (FieldOptions::template has_option<options::detail::not_json_tag>) {
        return true;
    } else {
        if constexpr(static_schema::JsonNullableSerializableValue<Field>) {
            if(static_schema::isNull(obj)) {
                if(!writer.write_null()) {
                    return ctx.withWriterError(writer);
                }
                return true;
            }
        }
        using Inner = std::remove_cvref_t<decltype(static_schema::getRef(obj))>;
        return SerializeNonNullValue<FieldOptions, Inner>(static_schema::getRef(obj), writer, ctx);
    }
}

} // namespace serializer_details

template <static_schema::JsonSerializableValue InputObjectT, writer::WriterLike Writer>
constexpr auto SerializeWithWriter(const InputObjectT & obj, Writer & writer) {
    serializer_details::SerializationContext<typename Writer::iterator_type, typename Writer::error_type> ctx(writer.current());
    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    if(serializer_details::SerializeValue<typename Meta::options>(obj, writer, ctx)) {
        ctx.finish(writer);
    }
    return ctx.result();
}

template <static_schema::JsonSerializableValue InputObjectT, CharOutputIterator It, CharSentinelForOut<It> Sent>
constexpr SerializeResult<It, JsonWriterError> Serialize(const InputObjectT & obj, It begin, const Sent & end) {
    JsonIteratorWriter<It, Sent> writer(begin, end);
    return SerializeWithWriter(obj, writer);
}

template<static_schema::JsonSerializableValue InputObjectT>
constexpr auto Serialize(const InputObjectT& obj, std::string& out)
{
    out.clear();
    return Serialize(obj, std::back_inserter(out), io_details::limitless_sentinel{});
}

template <class T>
    requires (!static_schema::JsonSerializableValue<T>)
constexpr auto Serialize(const T&, std::string&) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ ChainBattles ]]] T is not a supported serializable model type.\n"
                  "see JsonSerializableValue concept for full rules");
}

} // namespace ChainBattles
