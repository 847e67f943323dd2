// busq++ contributors

#ifndef BUSQ_CPP
#define BUSQ_CPP

#include <busq++/afc.hpp>
#include <busq++/connection.hpp>
#include <busq++/debug_server.hpp>
#include <busq++/device.hpp>
#include <busq++/disposable.hpp>
#include <busq++/error.hpp>
#include <busq++/file_relay.hpp>
#include <busq++/house_arrest.hpp>
#include <busq++/installation_proxy.hpp>
#include <busq++/lockdown.hpp>
#include <busq++/log.hpp>
#include <busq++/pair_record.hpp>
#include <busq++/property_list_service.hpp>
#include <busq++/provider.hpp>
#include <busq++/result.hpp>
#include <busq++/screenshot.hpp>
#include <busq++/service.hpp>
#include <busq++/springboard.hpp>
#include <busq++/syslog_relay.hpp>
#include <busq++/tls.hpp>
#include <busq++/usbmuxd.hpp>
#include <busq++/value.hpp>

#endif
