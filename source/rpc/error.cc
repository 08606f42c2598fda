// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "error.h"

namespace geoline::rpc
{

bad_request::bad_request()
    : bad_request("bad request")
{
}
bad_request::bad_request(const char *msg)
    : runtime_error(msg)
{
}

bad_method::bad_method()
    : bad_method("bad method")
{
}
bad_method::bad_method(const char *msg)
    : runtime_error(msg)
{
}

}  // namespace geoline::rpc
