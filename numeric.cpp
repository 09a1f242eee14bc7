#include "numeric.hpp"

#include <iomanip>
#include <sstream>

namespace gds
{

    std::string PrintableFloat::to_string() const
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << value;
        return oss.str();
    }

    std::ostream &operator<<(std::ostream &os, const PrintableFloat &pf)
    {
        return os << pf.to_string();
    }

} // namespace gds
