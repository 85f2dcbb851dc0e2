#include "remotefs/transfer/transfer_session.hpp"
#include "remotefs/common/exception.hpp"

namespace remotefs {

void TransferSession::CreateFile(const string &path) {
	throw NotImplementedException("%s: CreateFile is not implemented!", GetName());
}

void TransferSession::MakeDirectory(const string &path) {
	throw NotImplementedException("%s: MakeDirectory is not implemented!", GetName());
}

void TransferSession::ChangeDirectory(const string &path) {
	throw NotImplementedException("%s: ChangeDirectory is not implemented!", GetName());
}

string TransferSession::GetWorkingDirectory() {
	throw NotImplementedException("%s: GetWorkingDirectory is not implemented!", GetName());
}

vector<RemoteFileInfo> TransferSession::ListDirectory(const string &path) {
	throw NotImplementedException("%s: ListDirectory is not implemented!", GetName());
}

RemoteFileInfo TransferSession::Stat(const string &path) {
	throw NotImplementedException("%s: Stat is not implemented!", GetName());
}

void TransferSession::RemoveFile(const string &path) {
	throw NotImplementedException("%s: RemoveFile is not implemented!", GetName());
}

void TransferSession::RemoveDirectory(const string &path) {
	throw NotImplementedException("%s: RemoveDirectory is not implemented!", GetName());
}

void TransferSession::MoveFile(const string &source, const string &target) {
	throw NotImplementedException("%s: MoveFile is not implemented!", GetName());
}

} // namespace remotefs
