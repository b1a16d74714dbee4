#pragma once

// Main public API - include all headers
#include "natscred/constants.hpp"
#include "natscred/errors.hpp"
#include "natscred/key_material.hpp"
#include "natscred/claims.hpp"
#include "natscred/operator_claims.hpp"
#include "natscred/account_claims.hpp"
#include "natscred/user_claims.hpp"
#include "natscred/claim_set.hpp"
#include "natscred/signer.hpp"
#include "natscred/hierarchy.hpp"
#include "natscred/creds.hpp"
#include "natscred/bundle.hpp"
#include "natscred/validation.hpp"
#include "natscred/config.hpp"
