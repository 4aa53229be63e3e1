#pragma once
#include <provenance/schema/product_record.hpp>
#include <scale/scale.hpp>

namespace provenance::schema::encoding::scale {

void encode(provenance::schema::product_record<1>&& o,
            ::scale::Encoder& encoder);
void decode(provenance::schema::product_record<1>&& o,
            ::scale::Decoder& decoder);

}  // namespace provenance::schema::encoding::scale
