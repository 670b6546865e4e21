// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef impossible_evidence_error_hpp
#define impossible_evidence_error_hpp

#include <string>

#include "user_error.hpp"

namespace heredity {

/**
 An ImpossibleEvidenceError is thrown when the observed traits have zero probability under the
 probability tables, so no posterior distribution exists.
 */
class ImpossibleEvidenceError : public UserError
{
public:
    ImpossibleEvidenceError() = default;
    
    virtual ~ImpossibleEvidenceError() override = default;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
};

} // namespace heredity

#endif
