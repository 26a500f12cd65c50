#ifndef DNSPROBE_DNS_H_
#define DNSPROBE_DNS_H_

#include "dns_definition.hpp"
#include "dns_message_decoder.hpp"
#include "dns_message_encoder.hpp"
#include "dns_mnemonic.hpp"
#include "dns_name.hpp"
#include "dns_rdata.hpp"

#endif  // DNSPROBE_DNS_H_
