#pragma once

#include <string>

extern "C" {
#include <amqp.h>
#include <amqp_tcp_socket.h>
}

namespace mrp {
	///Publishes scenario results to a RabbitMQ fanout exchange.
	typedef struct MQ {
		MQ(const std::string& mqHost,
			const std::string& mqUsername,
			const std::string& mqPassword,
			const std::string& mqQueueName,
			int port)
			: mqHost(mqHost), mqUsername(mqUsername), mqPassword(mqPassword), mqQueueName(mqQueueName), port(port) {}
		~MQ() { deinit(); }

		MQ(const MQ&) = delete;
		MQ& operator=(const MQ&) = delete;

		/*
		return: 0 - connected, channel 1 open; <0 - the failing step
		*/
		int init();
		void deinit();

		///@return: 0 on success, <0 when the broker refused the message
		int send(const std::string& msg);

	private:
		static bool rpcOk(amqp_rpc_reply_t reply, const char* context);

		amqp_connection_state_t conn = nullptr;
		bool channelOpen = false;
		std::string mqHost;
		std::string mqUsername;
		std::string mqPassword;
		std::string mqQueueName;
		int port;
	} *PMQ;
}
