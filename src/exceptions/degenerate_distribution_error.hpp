// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef degenerate_distribution_error_hpp
#define degenerate_distribution_error_hpp

#include <string>

#include "program_error.hpp"

namespace heredity {

/**
 A DegenerateDistributionError is thrown when a distribution with no probability mass is
 normalised. This always means an enumeration did not supply every configuration.
 */
class DegenerateDistributionError : public ProgramError
{
public:
    DegenerateDistributionError() = delete;
    
    DegenerateDistributionError(std::string person, std::string distribution);
    
    virtual ~DegenerateDistributionError() override = default;
    
    const std::string& person() const noexcept;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    
    std::string person_, distribution_;
};

} // namespace heredity

#endif
