#include "utils.hpp"
#include "mq.hpp"

using namespace mrp;

//static
bool
MQ::rpcOk(amqp_rpc_reply_t reply, const char* context) {
	switch (reply.reply_type) {
	case AMQP_RESPONSE_NORMAL:
		return true;
	case AMQP_RESPONSE_NONE:
		Utils::log(-1, "%s: missing RPC reply type\n", context);
		break;
	case AMQP_RESPONSE_LIBRARY_EXCEPTION:
		Utils::log(-1, "%s: %s\n", context, amqp_error_string2(reply.library_error));
		break;
	case AMQP_RESPONSE_SERVER_EXCEPTION:
		Utils::log(-1, "%s: server exception, method id 0x%08X\n", context, reply.reply.id);
		break;
	}
	return false;
}

int
MQ::init() {
	amqp_socket_t* socket = nullptr;
	int status, result = 0;

	do {
		conn = amqp_new_connection();
		if (!conn) {
			Utils::log(-1, "amqp new connection error\n");
			result = -1;
			break;
		}
		socket = amqp_tcp_socket_new(conn);
		if (!socket) {
			Utils::log(-1, "amqp new socket error\n");
			result = -1;
			break;
		}
		status = amqp_socket_open(socket, mqHost.c_str(), port);
		if (status) {
			Utils::log(-1, "amqp open socket %s:%d error: %s\n", mqHost.data(), port, amqp_error_string2(status));
			result = -2;
			break;
		}
		if (!rpcOk(amqp_login(conn, "/", 0, 131072, 0, AMQP_SASL_METHOD_PLAIN,
			mqUsername.c_str(), mqPassword.c_str()), "Logging in")) {
			result = -3;
			break;
		}
		amqp_channel_open(conn, 1);
		if (!rpcOk(amqp_get_rpc_reply(conn), "Opening channel")) {
			result = -4;
			break;
		}
		channelOpen = true;
	} while (false);

	if (result != 0) deinit();
	return result;
}

void
MQ::deinit() {
	if (!conn) return;
	if (channelOpen) {
		amqp_channel_close(conn, 1, AMQP_REPLY_SUCCESS);
		amqp_connection_close(conn, AMQP_REPLY_SUCCESS);
		channelOpen = false;
	}
	amqp_destroy_connection(conn);
	conn = nullptr;
}

int
MQ::send(const std::string& msg) {
	if (!conn || !channelOpen) {
		Utils::log(-1, "amqp publish without an open channel\n");
		return -1;
	}
	amqp_bytes_t body;
	body.len = msg.size();
	body.bytes = const_cast<char*>(msg.data());

	amqp_basic_properties_t props;
	props._flags = AMQP_BASIC_CONTENT_TYPE_FLAG | AMQP_BASIC_DELIVERY_MODE_FLAG;
	props.content_type = amqp_cstring_bytes("application/json");
	props.delivery_mode = 2;	///persistent

	int status = amqp_basic_publish(conn, 1, amqp_cstring_bytes("amq.fanout"),
		amqp_cstring_bytes(mqQueueName.c_str()), 0, 0, &props, body);
	if (status != AMQP_STATUS_OK) {
		Utils::log(-1, "Publishing: %s\n", amqp_error_string2(status));
		return -2;
	}
	return 0;
}
