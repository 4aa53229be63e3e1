#include <provenance/schema/encoding/scale/product_record.hpp>

using namespace provenance::schema;

namespace provenance::schema::encoding::scale {

// Field order is the persisted layout; append new fields under a new
// record version rather than reordering these.
void encode(product_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.name, encoder);
  encode(o.status, encoder);
  encode(o.owner, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
  encode(o.description, encoder);
  encode(o.category, encoder);
}

void decode(product_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.name, decoder);
  decode(o.status, decoder);
  decode(o.owner, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
  decode(o.description, decoder);
  decode(o.category, decoder);
}

}  // namespace provenance::schema::encoding::scale
