#include "light_organ/errors.hpp"

const char* organ_err_to_name(esp_err_t err) {
  switch (err) {
    case ORGAN_ERR_DEVICE:
      return "ORGAN_ERR_DEVICE";
    case ORGAN_ERR_UNDERRUN:
      return "ORGAN_ERR_UNDERRUN";
    case ORGAN_ERR_MALFORMED_FRAME:
      return "ORGAN_ERR_MALFORMED_FRAME";
    case ORGAN_ERR_TRANSPORT_CLOSED:
      return "ORGAN_ERR_TRANSPORT_CLOSED";
    case ORGAN_ERR_END_OF_STREAM:
      return "ORGAN_ERR_END_OF_STREAM";
    default:
      return esp_err_to_name(err);
  }
}
