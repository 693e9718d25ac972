#include "mpcrec/net/envelope.hpp"

#include <stdexcept>

#include "mpcrec/crypto/encoding.hpp"

namespace mpcrec {

Bytes EncodeEnvelope(const Envelope& envelope) {
  ByteWriter writer;
  writer.WriteSized(envelope.session_id);
  writer.WriteU32(envelope.from);
  writer.WriteU32(envelope.to);
  writer.WriteU32(envelope.type);
  writer.WriteSized(envelope.payload);
  return writer.Take();
}

Envelope DecodeEnvelope(std::span<const uint8_t> encoded,
                        size_t max_session_id_len,
                        size_t max_payload_len) {
  ByteReader reader(encoded);

  Envelope out;
  out.session_id = reader.ReadSized(max_session_id_len, "session_id");
  out.from = reader.ReadU32();
  out.to = reader.ReadU32();
  out.type = reader.ReadU32();
  out.payload = reader.ReadSized(max_payload_len, "payload");
  reader.ExpectEnd("Envelope");
  return out;
}

}  // namespace mpcrec
