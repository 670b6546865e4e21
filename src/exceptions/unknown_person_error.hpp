// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef unknown_person_error_hpp
#define unknown_person_error_hpp

#include <string>

#include "program_error.hpp"

namespace heredity {

/**
 An UnknownPersonError is thrown when a person is referenced that is not a member of the pedigree
 being evaluated.
 */
class UnknownPersonError : public ProgramError
{
public:
    UnknownPersonError() = delete;
    
    UnknownPersonError(std::string person, std::string where);
    
    virtual ~UnknownPersonError() override = default;
    
    const std::string& person() const noexcept;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    
    std::string person_, where_;
};

} // namespace heredity

#endif
