#include "crypto.hpp"

namespace securepath::sshc::test {

// ssh-ed25519
std::string const ed25519_fprint = "SHA256:AJxI+SMrILxnTIinoWVeFhz3BGq9zH+VyOcH6IsJV/0";
std::string const ed25519_pubkey = "AAAAC3NzaC1lZDI1NTE5AAAAIKybvEDG+Tp2x91UjeDAFwmeOfitihW8fKN4rzMf2DBn";
std::string const ed25519_privkey = "AAAAC3NzaC1lZDI1NTE5AAAAIKybvEDG+Tp2x91UjeDAFwmeOfitihW8fKN4rzMf2DBnAAAAQEee9Mvoputz204F1EtY51yPsLFm10kpJOw1tMVVyZT2rJu8QMb5OnbH3VSN4MAXCZ45+K2KFbx8o3ivMx/YMGcAAAARbWlrYWVsQG1pa2FlbC1kZXYBAgME";

// ssh-rsa 2048 bits
std::string const rsa_fprint = "SHA256:5Z6Yec2hkGWPFAfuGcjn9RqZ1TOInBzu9omIyXpByZk";
std::string const rsa_pubkey = "AAAAB3NzaC1yc2EAAAADAQABAAABAQDRdy5ReJknJnltipRomk22yJ+tRmFH1oSYAq9Aa+j4TzAdMp0DzEb35dvyHSP6mjfg6Lptu/0E7JXV4xpF+saJzLZiiwyxEViDRygRKaPTQSoh1gIrX2p5PWr2w9Mw2CJVWxt33q/c9xBsRgvx5rkaQayVqdsGEsJ0t7y/jm9sPtkwVkvWMcTKzv/PRFDRmPeoozyE7defF6/4ag+7wkv7sVFPVTscZFzEyrKuQtSMxoAv4SZ03XugtMF29koqTrlZnhzBGKJdQ25cm2M2EkxBeXZG2/TbaWOf89vTMoxuR4wd+VAdk7YB7+P0X2T0MzQzXKFYJbNpLpcpiO9bcJwn";
std::string const rsa_privkey = "AAAAB3NzaC1yc2EAAAEBANF3LlF4mScmeW2KlGiaTbbIn61GYUfWhJgCr0Br6PhPMB0ynQPMRvfl2/IdI/qaN+Doum27/QTsldXjGkX6xonMtmKLDLERWINHKBEpo9NBKiHWAitfank9avbD0zDYIlVbG3fer9z3EGxGC/HmuRpBrJWp2wYSwnS3vL+Ob2w+2TBWS9YxxMrO/89EUNGY96ijPITt158Xr/hqD7vCS/uxUU9VOxxkXMTKsq5C1IzGgC/hJnTde6C0wXb2SipOuVmeHMEYol1DblybYzYSTEF5dkbb9NtpY5/z29MyjG5HjB35UB2TtgHv4/RfZPQzNDNcoVgls2kulymI71twnCcAAAADAQABAAABAEOs0+QyqJjDj3vayDQ7llw12ZEsKgYBwvkx9NlFhBGl1A+66IvvlgZF15gT3in7ZY5e4szNbeQHZCmkpDpz2W1wHIUeE82powVXGhThdTKt3STtden5e/cL5uEvR66CRiV5uBg0dHFZyY6R2w4e0zMugMoiBMeji/wV2P+yz0ETP3/OmJAtEzT538yPUTZcXhsrAHt7NYFRsyCPOp0/cAcjrvVza/0Hc0EQOXH4CQ1Z5wv8TT/mOl0iwypw+bpWrBMNraajoc2+aKoBaau0DL3SCKBBoyryywFQrE2nVuJnZ6srte+xqq3k5Q2eJqMydYez0pgNpJDF+VJhx20IDaEAAACAFaYIXLsJq7cgq/YJ/e5JgvFB3kOLM6JjgCBqIlC8u3SY/ItbsL8ABV1Q9uhYiBS0hfPVvyqKbn2DH5I28QGO28iZj4C6/iN+gw4e7dYmajLaXfMptiPFDRzlpiBZBvQal2RvyAlZPhvBmMyBECwZL5YnCuftjPIttil5XUoGG0QAAACBAO0Vru8K5QbuI/JKlqtT/RJNDqvFvl7rsLXHQmxh+GOod1CH6b7BFhEOXk3k33zuvS5z8/XdmOVgDAMtUIpuJHg8KR8E8/N49C46qo0NvtxO7mlsJcHudO7iwInzamnBESuTH66Ksiw0D39b3gSZexzKMwyd9PNbex1VYd7L4SwJAAAAgQDiLWR/pzoIh/NRufun43BEu0xFCBHKOzv6k2V0JPpHCJWldZaO5dGwkEwCfX3OwzbxePRCgZvBOqxFINpjWWgadB+NdehGUXt+/0PN2Z8Xz4tiIsRHbHWtfVfo4McKc2SiO+6hdcW54WtrgVNn7kew9KTZnoyUpPG3Md0AeIvyrwAAABFtaWthZWxAbWlrYWVsLWRldgEC";

ssh_private_key crypto_test_context::test_ed25519_private_key() const {
	return load_raw_base64_ssh_private_key(ed25519_privkey, *this, call);
}

ssh_private_key crypto_test_context::test_rsa_private_key() const {
	return load_raw_base64_ssh_private_key(rsa_privkey, *this, call);
}

}
