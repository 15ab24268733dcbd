#include "example_shipment.h"

namespace shipx::cli {

using namespace shipx::courier::v1;

namespace {

void FillAddress(Address* address, const char* street, const char* building_number, const char* city, const char* post_code) {
  address->set_street(street);
  address->set_building_number(building_number);
  address->set_city(city);
  address->set_post_code(post_code);
  address->set_country_code("PL");
}

} // namespace

ShipmentRequest ExampleShipment() {
  ShipmentRequest request;

  auto* receiver = request.mutable_receiver();
  receiver->set_first_name("Jan");
  receiver->set_last_name("Kowalski");
  receiver->set_email("jan.kowalski@example.com");
  receiver->set_phone("123456789");
  FillAddress(receiver->mutable_address(), "ul. Testowa 1", "1", "Warszawa", "00-001");

  auto* sender = request.mutable_sender();
  sender->set_first_name("Anna");
  sender->set_last_name("Nowak");
  sender->set_email("anna.nowak@example.com");
  sender->set_phone("987654321");
  FillAddress(sender->mutable_address(), "ul. Przykładowa 2", "2", "Kraków", "30-002");

  auto* parcel     = request.add_parcels();
  auto* dimensions = parcel->mutable_dimensions();
  dimensions->set_length(300);
  dimensions->set_width(200);
  dimensions->set_height(100);
  dimensions->set_unit("mm");
  parcel->mutable_weight()->set_amount(2.5);
  parcel->mutable_weight()->set_unit("kg");
  parcel->set_is_non_standard(false);

  request.mutable_insurance()->set_amount(25);
  request.mutable_insurance()->set_currency("PLN");

  (*request.mutable_custom_attributes())["sending_method"] = "dispatch_order";
  (*request.mutable_custom_attributes())["target_point"]   = "KRA012";

  request.set_service("inpost_courier_standard");
  request.set_reference("ORDER_12345");
  request.set_comments("Please handle the package with care");
  return request;
}

} // namespace shipx::cli
