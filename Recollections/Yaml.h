
#ifndef RECOLLECTIONS_YAML_H_
#define RECOLLECTIONS_YAML_H_

#include <QString>

#include <yaml-cpp/yaml.h>

namespace YAML {

template <>
struct convert<QString> {
	static Node encode(const QString &rhs) {
		return Node(rhs.toStdString());
	}

	static bool decode(const Node &node, QString &rhs) {
		if (!node.IsScalar()) {
			return false;
		}

		rhs = QString::fromStdString(node.Scalar());
		return true;
	}
};

}

#endif
