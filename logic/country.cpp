#include "prima/country.h"

namespace prima {

std::string_view Country::to_string() const noexcept
{
    return iso_code();
}

}
