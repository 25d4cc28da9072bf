#pragma once

#include "mnist/compression.hpp"
#include "mnist/errors.hpp"
#include "mnist/fetcher.hpp"
#include "mnist/http_client.hpp"
#include "mnist/idx.hpp"
#include "mnist/printer.hpp"
#include "mnist/reader.hpp"
