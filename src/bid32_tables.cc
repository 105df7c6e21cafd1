// Copyright 2020 Alexander Bolz
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "bid32_tables.h"

//==================================================================================================
// Constant data: 119 rows, 82 bytes per row (+ 64 bytes)
//
// Generated by tools/gen_bid32_tables.py.
//==================================================================================================

namespace {

constexpr int TableSize = bidconv::impl::MaxTableExponent - bidconv::impl::MinTableExponent + 1;

constexpr bidconv::impl::uint64x2 Breakpoints[TableSize] = {
    {0x0001AFCEF51F0FB5, 0xEFF7B866E8BD92F7}, // e = -80
    {0x000159725DB272F7, 0xF32C938586FE0F2C}, // e = -79
    {0x0001145B7E285BF9, 0x8F56DC6AD264D8F0}, // e = -78
    {0x0001BA2BFD0D5FF5, 0xB22493DE1D6E27E7}, // e = -77
    {0x000161BCCA711991, 0x5B50764B4ABE8652}, // e = -76
    {0x00011AFD6EC0E141, 0x15D9F83C3BCB9EA8}, // e = -75
    {0x0001C4C8B1349B9B, 0x56298D2D2C78FDDA}, // e = -74
    {0x00016A3A275D4949, 0x11BAD75756C7317B}, // e = -73
    {0x000121C81F7DD43A, 0x74957912ABD28DFC}, // e = -72
    {0x0001CFA698C95390, 0xBA88C1B77950E32D}, // e = -71
    {0x000172EBAD6DDC73, 0xC86D67C5FAA71C24}, // e = -70
    {0x000128BC8ABE49F6, 0x39F11FD195527CE9}, // e = -69
    {0x0001DAC74463A989, 0xF64E994F5550C7DC}, // e = -68
    {0x00017BD29D1C87A1, 0x91D87AA5DDDA397D}, // e = -67
    {0x00012FDBB0E39FB4, 0x74AD2EEB17E1C797}, // e = -66
    {0x0001E62C4E38FF87, 0x211517DE8C9C728B}, // e = -65
    {0x000184F03E93FF9F, 0x4DAA797ED6E38ED6}, // e = -64
    {0x0001372698766619, 0x0AEEC798ABE93F11}, // e = -63
    {0x0001F1D75A5709C1, 0xAB17A5C1130ECB4F}, // e = -62
    {0x00018E45E1DF3B01, 0x55AC849A75A56F72}, // e = -61
    {0x00013E9E4E4C2F34, 0x448A03AEC4845928}, // e = -60
    {0x0001FDCA16E04B86, 0xD41005E46DA08EA7}, // e = -59
    {0x000197D4DF19D605, 0x767337E9F14D3EEC}, // e = -58
    {0x00014643E5AE44D1, 0x2B8F5FEE5AA43256}, // e = -57
    {0x000105031E2503DA, 0x893F7FF1E21CF512}, // e = -56
    {0x0001A19E96A19FC4, 0x0ECBFFE969C7EE83}, // e = -55
    {0x00014E1878814C9C, 0xD8A33321216CBECF}, // e = -54
    {0x00010B46C6CDD6E3, 0xE0828F4DB456FF0C}, // e = -53
    {0x0001ABA4714957D3, 0x00D0E549208B31AD}, // e = -52
    {0x0001561D276DDFDC, 0x00A71DD41A08F48A}, // e = -51
    {0x000111B0EC57E649, 0x9A1F4B1014D3F6D5}, // e = -50
    {0x0001B5E7E08CA3A8, 0xF6987819BAECBE22}, // e = -49
    {0x00015E531A0A1C87, 0x2BAD2CE16256FE81}, // e = -48
    {0x000118427B3B4A05, 0xBC8A8A4DE8459867}, // e = -47
    {0x0001C06A5EC5433C, 0x60DDAA16406F5A3F}, // e = -46
    {0x000166BB7F0435C9, 0xE717BB45005914FF}, // e = -45
    {0x00011EFC659CF7D4, 0xB8DFC904004743FF}, // e = -44
    {0x0001CB2D6F618C87, 0x8E32DB399A0B9FFF}, // e = -43
    {0x00016F578C4E0A06, 0x0B5BE2947B3C7FFF}, // e = -42
    {0x000125DFA371A19E, 0x6F7CB54395C9FFFF}, // e = -41
    {0x0001D6329F1C35CA, 0x4BFABB9F560FFFFF}, // e = -40
    {0x000178287F49C4A1, 0xD6622FB2AB3FFFFF}, // e = -39
    {0x00012CED32A16A1B, 0x11E8262888FFFFFF}, // e = -38
    {0x0001E17B84357691, 0xB6403D0DA7FFFFFF}, // e = -37
    {0x0001812F9CF7920E, 0x2B66973E1FFFFFFF}, // e = -36
    {0x00013426172C74D8, 0x22B878FE7FFFFFFF}, // e = -35
    {0x0001ED09BEAD87C0, 0x378D8E63FFFFFFFF}, // e = -34
    {0x00018A6E32246C99, 0xC60AD84FFFFFFFFF}, // e = -33
    {0x00013B8B5B5056E1, 0x6B3BE03FFFFFFFFF}, // e = -32
    {0x0001F8DEF8808B02, 0x452C99FFFFFFFFFF}, // e = -31
    {0x000193E5939A08CE, 0x9DBD47FFFFFFFFFF}, // e = -30
    {0x0001431E0FAE6D72, 0x17CA9FFFFFFFFFFF}, // e = -29
    {0x0001027E72F1F128, 0x13087FFFFFFFFFFF}, // e = -28
    {0x00019D971E4FE840, 0x1E73FFFFFFFFFFFF}, // e = -27
    {0x00014ADF4B732033, 0x4B8FFFFFFFFFFFFF}, // e = -26
    {0x000108B2A2C28029, 0x093FFFFFFFFFFFFF}, // e = -25
    {0x0001A784379D99DB, 0x41FFFFFFFFFFFFFF}, // e = -24
    {0x000152D02C7E14AF, 0x67FFFFFFFFFFFFFF}, // e = -23
    {0x00010F0CF064DD59, 0x1FFFFFFFFFFFFFFF}, // e = -22
    {0x0001B1AE4D6E2EF4, 0xFFFFFFFFFFFFFFFF}, // e = -21
    {0x00015AF1D78B58C3, 0xFFFFFFFFFFFFFFFF}, // e = -20
    {0x0001158E460913CF, 0xFFFFFFFFFFFFFFFF}, // e = -19
    {0x0001BC16D674EC7F, 0xFFFFFFFFFFFFFFFF}, // e = -18
    {0x00016345785D89FF, 0xFFFFFFFFFFFFFFFF}, // e = -17
    {0x00011C37937E07FF, 0xFFFFFFFFFFFFFFFF}, // e = -16
    {0x0001C6BF52633FFF, 0xFFFFFFFFFFFFFFFF}, // e = -15
    {0x00016BCC41E8FFFF, 0xFFFFFFFFFFFFFFFF}, // e = -14
    {0x00012309CE53FFFF, 0xFFFFFFFFFFFFFFFF}, // e = -13
    {0x0001D1A94A1FFFFF, 0xFFFFFFFFFFFFFFFF}, // e = -12
    {0x000174876E7FFFFF, 0xFFFFFFFFFFFFFFFF}, // e = -11
    {0x00012A05F1FFFFFF, 0xFFFFFFFFFFFFFFFF}, // e = -10
    {0x0001DCD64FFFFFFF, 0xFFFFFFFFFFFFFFFF}, // e =  -9
    {0x00017D783FFFFFFF, 0xFFFFFFFFFFFFFFFF}, // e =  -8
    {0x0001312CFFFFFFFF, 0xFFFFFFFFFFFFFFFF}, // e =  -7
    {0x0001E847FFFFFFFF, 0xFFFFFFFFFFFFFFFF}, // e =  -6
    {0x0001869FFFFFFFFF, 0xFFFFFFFFFFFFFFFF}, // e =  -5
    {0x0001387FFFFFFFFF, 0xFFFFFFFFFFFFFFFF}, // e =  -4
    {0x0001F3FFFFFFFFFF, 0xFFFFFFFFFFFFFFFF}, // e =  -3
    {0x00018FFFFFFFFFFF, 0xFFFFFFFFFFFFFFFF}, // e =  -2
    {0x00013FFFFFFFFFFF, 0xFFFFFFFFFFFFFFFF}, // e =  -1
    {0x0001FFFFFFFFFFFF, 0xFFFFFFFFFFFFFFFF}, // e =   0
    {0x0001999999999999, 0x9999999999999999}, // e =   1
    {0x000147AE147AE147, 0xAE147AE147AE147A}, // e =   2
    {0x00010624DD2F1A9F, 0xBE76C8B439581062}, // e =   3
    {0x0001A36E2EB1C432, 0xCA57A786C226809D}, // e =   4
    {0x00014F8B588E368F, 0x08461F9F01B866E4}, // e =   5
    {0x00010C6F7A0B5ED8, 0xD36B4C7F34938583}, // e =   6
    {0x0001AD7F29ABCAF4, 0x85787A6520EC08D2}, // e =   7
    {0x00015798EE2308C3, 0x9DF9FB841A566D74}, // e =   8
    {0x000112E0BE826D69, 0x4B2E62D01511F12A}, // e =   9
    {0x0001B7CDFD9D7BDB, 0xAB7D6AE6881CB510}, // e =  10
    {0x00015FD7FE179649, 0x55FDEF1ED34A2A73}, // e =  11
    {0x000119799812DEA1, 0x1197F27F0F6E885C}, // e =  12
    {0x0001C25C26849768, 0x1C2650CB4BE40D60}, // e =  13
    {0x00016849B86A12B9, 0xB01EA70909833DE7}, // e =  14
    {0x0001203AF9EE7561, 0x59B21F3A6E0297EC}, // e =  15
    {0x0001CD2B297D889B, 0xC2B6985D7CD0F313}, // e =  16
    {0x000170EF54646D49, 0x6892137DFD73F5A9}, // e =  17
    {0x00012725DD1D243A, 0xBA0E75FE645CC487}, // e =  18
    {0x0001D83C94FB6D2A, 0xC34A5663D3C7A0D8}, // e =  19
    {0x000179CA10C92422, 0x35D511E976394D79}, // e =  20
    {0x00012E3B40A0E9B4, 0xF7DDA7EDF82DD794}, // e =  21
    {0x0001E392010175EE, 0x5962A6498D1625BA}, // e =  22
    {0x000182DB34012B25, 0x144EEB6E0A781E2F}, // e =  23
    {0x0001357C299A88EA, 0x76A58924D52CE4F2}, // e =  24
    {0x0001EF2D0F5DA7DD, 0x8AA27507BB7B07EA}, // e =  25
    {0x00018C240C4AECB1, 0x3BB52A6C95FC0655}, // e =  26
    {0x00013CE9A36F23C0, 0xFC90EEBD44C99EAA}, // e =  27
    {0x0001FB0F6BE50601, 0x941B17953ADC3110}, // e =  28
    {0x000195A5EFEA6B34, 0x767C12DDC8B02740}, // e =  29
    {0x00014484BFEEBC29, 0xF863424B06F3529A}, // e =  30
    {0x0001039D66589687, 0xF9E901D59F290EE1}, // e =  31
    {0x00019F623D5A8A73, 0x2974CFBC31DB4B02}, // e =  32
    {0x00014C4E977BA1F5, 0xBAC3D9635B15D59B}, // e =  33
    {0x000109D8792FB4C4, 0x95697AB5E277DE16}, // e =  34
    {0x0001A95A5B7F87A0, 0xEF0F2ABC9D8C9689}, // e =  35
    {0x000154484932D2E7, 0x25A5BBCA17A3ABA1}, // e =  36
    {0x00011039D428A8B8, 0xEAEAFCA1AC82EFB4}, // e =  37
    {0x0001B38FB9DAA78E, 0x44AB2DCF7A6B1920}, // e =  38
};

constexpr int16_t Exponents[TableSize] = {
     -27, // e = -80
     -24, // e = -79
     -21, // e = -78
     -17, // e = -77
     -14, // e = -76
     -11, // e = -75
      -7, // e = -74
      -4, // e = -73
      -1, // e = -72
       3, // e = -71
       6, // e = -70
       9, // e = -69
      13, // e = -68
      16, // e = -67
      19, // e = -66
      23, // e = -65
      26, // e = -64
      29, // e = -63
      33, // e = -62
      36, // e = -61
      39, // e = -60
      43, // e = -59
      46, // e = -58
      49, // e = -57
      52, // e = -56
      56, // e = -55
      59, // e = -54
      62, // e = -53
      66, // e = -52
      69, // e = -51
      72, // e = -50
      76, // e = -49
      79, // e = -48
      82, // e = -47
      86, // e = -46
      89, // e = -45
      92, // e = -44
      96, // e = -43
      99, // e = -42
     102, // e = -41
     106, // e = -40
     109, // e = -39
     112, // e = -38
     116, // e = -37
     119, // e = -36
     122, // e = -35
     126, // e = -34
     129, // e = -33
     132, // e = -32
     136, // e = -31
     139, // e = -30
     142, // e = -29
     145, // e = -28
     149, // e = -27
     152, // e = -26
     155, // e = -25
     159, // e = -24
     162, // e = -23
     165, // e = -22
     169, // e = -21
     172, // e = -20
     175, // e = -19
     179, // e = -18
     182, // e = -17
     185, // e = -16
     189, // e = -15
     192, // e = -14
     195, // e = -13
     199, // e = -12
     202, // e = -11
     205, // e = -10
     209, // e =  -9
     212, // e =  -8
     215, // e =  -7
     219, // e =  -6
     222, // e =  -5
     225, // e =  -4
     229, // e =  -3
     232, // e =  -2
     235, // e =  -1
     239, // e =   0
     242, // e =   1
     245, // e =   2
     248, // e =   3
     252, // e =   4
     255, // e =   5
     258, // e =   6
     262, // e =   7
     265, // e =   8
     268, // e =   9
     272, // e =  10
     275, // e =  11
     278, // e =  12
     282, // e =  13
     285, // e =  14
     288, // e =  15
     292, // e =  16
     295, // e =  17
     298, // e =  18
     302, // e =  19
     305, // e =  20
     308, // e =  21
     312, // e =  22
     315, // e =  23
     318, // e =  24
     322, // e =  25
     325, // e =  26
     328, // e =  27
     332, // e =  28
     335, // e =  29
     338, // e =  30
     341, // e =  31
     345, // e =  32
     348, // e =  33
     351, // e =  34
     355, // e =  35
     358, // e =  36
     361, // e =  37
     365, // e =  38
};

// Least significant word first.
constexpr bidconv::impl::Uint256 Multipliers1[TableSize] = {
    {{0x5375A13AD57881E8, 0x67D41A021DA8C6F1, 0x0919A5DCCD879FC9, 0x00000097C560BA6B}}, // e = -80
    {{0xA85309898AD6A262, 0xC1C92082A512F8AD, 0xCB600F5400E987BB, 0x000000BDB6B8E905}}, // e = -79
    {{0x1267CBEBED8C4AFA, 0xB23B68A34E57B6D9, 0x3E3813290123E9AA, 0x000000ED24672347}}, // e = -78
    {{0xAB80DF737477AEDC, 0xAF65216610F6D247, 0x86E30BF9A0B6720A, 0x0000009436C0760C}}, // e = -77
    {{0x9661175051959A93, 0x5B3E69BF953486D9, 0xA89BCEF808E40E8D, 0x000000B94470938F}}, // e = -76
    {{0xFBF95D2465FB0138, 0xB20E042F7A81A88F, 0x92C2C2B60B1D1230, 0x000000E7958CB873}}, // e = -75
    {{0xFD7BDA36BFBCE0C3, 0x6F48C29DAC910959, 0x3BB9B9B1C6F22B5E, 0x00000090BD77F348}}, // e = -74
    {{0x7CDAD0C46FAC18F4, 0x0B1AF34517B54BB0, 0x4AA8281E38AEB636, 0x000000B4ECD5F01A}}, // e = -73
    {{0x9C1184F58B971F31, 0x8DE1B0165DA29E9C, 0xDD523225C6DA63C3, 0x000000E2280B6C20}}, // e = -72
    {{0xE18AF319773E737F, 0x38AD0E0DFA85A321, 0x8A535F579C487E5A, 0x0000008D59072394}}, // e = -71
    {{0x59EDAFDFD50E105E, 0xC6D8519179270BEA, 0xACE8372D835A9DF0, 0x000000B0AF48EC79}}, // e = -70
    {{0xF0691BD7CA519476, 0xF88E65F5D770CEE4, 0x182244F8E431456C, 0x000000DCDB1B2798}}, // e = -69
    {{0x1641B166DE72FCCA, 0x1B58FFB9A6A6814F, 0x0F156B1B8E9ECB64, 0x0000008A08F0F8BF}}, // e = -68
    {{0xDBD21DC0960FBBFC, 0x222F3FA8105021A2, 0xD2DAC5E272467E3D, 0x000000AC8B2D36EE}}, // e = -67
    {{0x92C6A530BB93AAFB, 0x6ABB0F9214642A0B, 0x8791775B0ED81DCC, 0x000000D7ADF884AA}}, // e = -66
    {{0x3BBC273E753C4ADD, 0xC2B4E9BB4CBE9A47, 0x94BAEA98E947129F, 0x00000086CCBB52EA}}, // e = -65
    {{0x0AAB310E128B5D94, 0xB362242A1FEE40D9, 0x39E9A53F2398D747, 0x000000A87FEA27A5}}, // e = -64
    {{0x4D55FD51972E34F9, 0xA03AAD34A7E9D10F, 0x88640E8EEC7F0D19, 0x000000D29FE4B18E}}, // e = -63
    {{0x9055BE52FE7CE11C, 0x0424AC40E8F222A9, 0x153E891953CF6830, 0x00000083A3EEEEF9}}, // e = -62
    {{0xF46B2DE7BE1C1963, 0x052DD751232EAB53, 0x5A8E2B5FA8C3423C, 0x000000A48CEAAAB7}}, // e = -61
    {{0xF185F961ADA31FBB, 0x06794D256BFA5628, 0x3131B63792F412CB, 0x000000CDB0255565}}, // e = -60
    {{0x96F3BBDD0C85F3D5, 0xE40BD037637C75D9, 0x3EBF11E2BBD88BBE, 0x000000808E17555F}}, // e = -59
    {{0xFCB0AAD44FA770CA, 0x9D0EC4453C5B934F, 0x0E6ED65B6ACEAEAE, 0x000000A0B19D2AB7}}, // e = -58
    {{0xFBDCD58963914CFD, 0x445275568B727823, 0xD20A8BF245825A5A, 0x000000C8DE047564}}, // e = -57
    {{0xFAD40AEBBC75A03C, 0xD56712AC2E4F162C, 0x068D2EEED6E2F0F0, 0x000000FB158592BE}}, // e = -56
    {{0x1CC486D355C98426, 0x85606BAB9CF16DDC, 0xC4183D55464DD696, 0x0000009CED737BB6}}, // e = -55
    {{0x23F5A8882B3BE52F, 0x26B88696842DC953, 0x751E4CAA97E14C3C, 0x000000C428D05AA4}}, // e = -54
    {{0xECF312AA360ADE7A, 0x3066A83C25393BA7, 0x9265DFD53DD99F4B, 0x000000F53304714D}}, // e = -53
    {{0xF417EBAA61C6CB0D, 0xFE4029259743C548, 0x7B7FABE546A8038E, 0x000000993FE2C6D0}}, // e = -52
    {{0x311DE694FA387DD0, 0xBDD0336EFD14B69B, 0x9A5F96DE98520472, 0x000000BF8FDB7884}}, // e = -51
    {{0xFD65603A38C69D44, 0x6D44404ABC59E441, 0xC0F77C963E66858F, 0x000000EF73D256A5}}, // e = -50
    {{0x3E5F5C24637C224A, 0xA44AA82EB5B82EA9, 0x989AADDDE7001379, 0x00000095A8637627}}, // e = -49
    {{0x8DF7332D7C5B2ADD, 0x0D5D523A63263A53, 0x7EC1595560C01858, 0x000000BB127C53B1}}, // e = -48
    {{0x7174FFF8DB71F594, 0x10B4A6C8FBEFC8E8, 0xDE71AFAAB8F01E6E, 0x000000E9D71B689D}}, // e = -47
    {{0x46E91FFB8927397D, 0xCA70E83D9D75DD91, 0xAB070DCAB3961304, 0x0000009226712162}}, // e = -46
    {{0x98A367FA6B7107DC, 0xFD0D224D04D354F5, 0x55C8D13D607B97C5, 0x000000B6B00D69BB}}, // e = -45
    {{0xFECC41F9064D49D3, 0x7C506AE046082A32, 0x2B3B058CB89A7DB7, 0x000000E45C10C42A}}, // e = -44
    {{0xDF3FA93BA3F04E24, 0xADB242CC2BC51A5F, 0x5B04E377F3608E92, 0x0000008EB98A7A9A}}, // e = -43
    {{0xD70F938A8CEC61AD, 0x591ED37F36B660F7, 0xF1C61C55F038B237, 0x000000B267ED1940}}, // e = -42
    {{0xCCD3786D30277A18, 0x2F66885F0463F935, 0x2E37A36B6C46DEC5, 0x000000DF01E85F91}}, // e = -41
    {{0xA0042B443E18AC4F, 0x3DA0153B62BE7BC1, 0xBCE2C62323AC4B3B, 0x0000008B61313BBA}}, // e = -40
    {{0x080536154D9ED763, 0x0D081A8A3B6E1AB2, 0x6C1B77ABEC975E0A, 0x000000AE397D8AA9}}, // e = -39
    {{0x8A06839AA1068D3B, 0x904A212CCA49A15E, 0xC7225596E7BD358C, 0x000000D9C7DCED53}}, // e = -38
    {{0x16441240A4A41845, 0xDA2E54BBFE6E04DB, 0x5C75757E50D64177, 0x000000881CEA1454}}, // e = -37
    {{0xDBD516D0CDCD1E56, 0xD0B9E9EAFE098611, 0x7392D2DDE50BD1D5, 0x000000AA24249969}}, // e = -36
    {{0x52CA5C85014065EC, 0x44E86465BD8BE796, 0xD07787955E4EC64B, 0x000000D4AD2DBFC3}}, // e = -35
    {{0xF3BE79D320C83FB3, 0x0B113EBF967770BD, 0x624AB4BD5AF13BEF, 0x00000084EC3C97DA}}, // e = -34
    {{0x70AE1847E8FA4FA0, 0xCDD58E6F7C154CED, 0xFADD61ECB1AD8AEA, 0x000000A6274BBDD0}}, // e = -33
    {{0xCCD99E59E338E388, 0x814AF20B5B1AA028, 0x3994BA67DE18EDA5, 0x000000CFB11EAD45}}, // e = -32
    {{0x800802F82E038E35, 0x70CED74718F0A419, 0x43FCF480EACF9487, 0x00000081CEB32C4B}}, // e = -31
    {{0xE00A03B6398471C2, 0x4D028D18DF2CCD1F, 0x14FC31A1258379A9, 0x000000A2425FF75E}}, // e = -30
    {{0xD80C84A3C7E58E33, 0xA043305F16F80067, 0x9A3B3E096EE45813, 0x000000CAD2F7F535}}, // e = -29
    {{0xCE0FA5CCB9DEF1C0, 0x8853FC76DCB60081, 0x00CA0D8BCA9D6E18, 0x000000FD87B5F283}}, // e = -28
    {{0x20C9C79FF42B5718, 0x55347DCA49F1C051, 0xE07E48775EA264CF, 0x0000009E74D1B791}}, // e = -27
    {{0x68FC3987F1362CDE, 0x2A819D3CDC6E3065, 0x589DDA95364AFE03, 0x000000C612062576}}, // e = -26
    {{0xC33B47E9ED83B815, 0xF522048C1389BC7E, 0xEEC5513A83DDBD83, 0x000000F79687AED3}}, // e = -25
    {{0x3A050CF23472530D, 0x793542D78C3615CF, 0x753B52C4926A9672, 0x0000009ABE14CD44}}, // e = -24
    {{0x0886502EC18EE7D1, 0x1782938D6F439B43, 0x928A2775B7053C0F, 0x000000C16D9A0095}}, // e = -23
    {{0xCAA7E43A71F2A1C5, 0xDD633870CB148213, 0xF72CB15324C68B12, 0x000000F1C90080BA}}, // e = -22
    {{0x5EA8EEA48737A51B, 0xCA5E03467EECD14C, 0xDA7BEED3F6FC16EB, 0x000000971DA05074}}, // e = -21
    {{0x76532A4DA9058E62, 0xBCF584181EA8059F, 0x111AEA88F4BB1CA6, 0x000000BCE5086492}}, // e = -20
    {{0x53E7F4E11346F1FA, 0x6C32E51E26520707, 0x9561A52B31E9E3D0, 0x000000EC1E4A7DB6}}, // e = -19
    {{0x9470F90CAC0C573C, 0x439FCF32D7F34464, 0x1D5D073AFF322E62, 0x0000009392EE8E92}}, // e = -18
    {{0xB98D374FD70F6D0B, 0xD487C2FF8DF0157D, 0xA4B44909BEFEB9FA, 0x000000B877AA3236}}, // e = -17
    {{0x27F08523CCD3484E, 0x89A9B3BF716C1ADD, 0x4DE15B4C2EBE6879, 0x000000E69594BEC4}}, // e = -16
    {{0x38F6533660040D31, 0xF60A1057A6E390CA, 0xB0ACD90F9D37014B, 0x000000901D7CF73A}}, // e = -15
    {{0xC733E803F805107D, 0xF38C946D909C74FC, 0x5CD80F538484C19E, 0x000000B424DC3509}}, // e = -14
    {{0xF900E204F606549C, 0xB06FB988F4C3923B, 0xB40E132865A5F206, 0x000000E12E13424B}}, // e = -13
    {{0x7BA08D4319C3F4E2, 0x2E45D3F598FA3B65, 0x5088CBF93F87B744, 0x0000008CBCCC096F}}, // e = -12
    {{0xDA88B093E034F21A, 0x39D748F2FF38CA3E, 0x24AAFEF78F69A515, 0x000000AFEBFF0BCB}}, // e = -11
    {{0x912ADCB8D8422EA1, 0x884D1B2FBF06FCCE, 0xEDD5BEB573440E5A, 0x000000DBE6FECEBD}}, // e = -10
    {{0x1ABAC9F387295D25, 0x953030FDD7645E01, 0xB4A59731680A88F8, 0x00000089705F4136}}, // e =  -9
    {{0x61697C7068F3B46E, 0xBA7C3D3D4D3D7581, 0x61CEFCFDC20D2B36, 0x000000ABCC771184}}, // e =  -8
    {{0xB9C3DB8C8330A189, 0x691B4C8CA08CD2E1, 0x7A42BC3D32907604, 0x000000D6BF94D5E5}}, // e =  -7
    {{0x141A6937D1FE64F6, 0xC1B10FD7E45803CD, 0x6C69B5A63F9A49C2, 0x0000008637BD05AF}}, // e =  -6
    {{0x59210385C67DFE33, 0x721D53CDDD6E04C0, 0x4784230FCF80DC33, 0x000000A7C5AC471B}}, // e =  -5
    {{0x6F694467381D7DC0, 0x4EA4A8C154C985F0, 0x19652BD3C3611340, 0x000000D1B71758E2}}, // e =  -4
    {{0x45A1CAC083126E98, 0x3126E978D4FDF3B6, 0x4FDF3B645A1CAC08, 0x00000083126E978D}}, // e =  -3
    {{0xD70A3D70A3D70A3E, 0x3D70A3D70A3D70A3, 0xA3D70A3D70A3D70A, 0x000000A3D70A3D70}}, // e =  -2
    {{0xCCCCCCCCCCCCCCCD, 0xCCCCCCCCCCCCCCCC, 0xCCCCCCCCCCCCCCCC, 0x000000CCCCCCCCCC}}, // e =  -1
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000008000000000}}, // e =   0
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000A000000000}}, // e =   1
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000C800000000}}, // e =   2
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000FA00000000}}, // e =   3
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000009C40000000}}, // e =   4
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000C350000000}}, // e =   5
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000F424000000}}, // e =   6
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000009896800000}}, // e =   7
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000BEBC200000}}, // e =   8
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000EE6B280000}}, // e =   9
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000009502F90000}}, // e =  10
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000BA43B74000}}, // e =  11
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000E8D4A51000}}, // e =  12
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000009184E72A00}}, // e =  13
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000B5E620F480}}, // e =  14
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000E35FA931A0}}, // e =  15
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000008E1BC9BF04}}, // e =  16
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000B1A2BC2EC5}}, // e =  17
    {{0x0000000000000000, 0x0000000000000000, 0x4000000000000000, 0x000000DE0B6B3A76}}, // e =  18
    {{0x0000000000000000, 0x0000000000000000, 0xE800000000000000, 0x0000008AC7230489}}, // e =  19
    {{0x0000000000000000, 0x0000000000000000, 0x6200000000000000, 0x000000AD78EBC5AC}}, // e =  20
    {{0x0000000000000000, 0x0000000000000000, 0x7A80000000000000, 0x000000D8D726B717}}, // e =  21
    {{0x0000000000000000, 0x0000000000000000, 0xAC90000000000000, 0x000000878678326E}}, // e =  22
    {{0x0000000000000000, 0x0000000000000000, 0x57B4000000000000, 0x000000A968163F0A}}, // e =  23
    {{0x0000000000000000, 0x0000000000000000, 0xEDA1000000000000, 0x000000D3C21BCECC}}, // e =  24
    {{0x0000000000000000, 0x0000000000000000, 0x1484A00000000000, 0x0000008459516140}}, // e =  25
    {{0x0000000000000000, 0x0000000000000000, 0x19A5C80000000000, 0x000000A56FA5B990}}, // e =  26
    {{0x0000000000000000, 0x0000000000000000, 0x200F3A0000000000, 0x000000CECB8F27F4}}, // e =  27
    {{0x0000000000000000, 0x0000000000000000, 0x9409844000000000, 0x000000813F3978F8}}, // e =  28
    {{0x0000000000000000, 0x0000000000000000, 0xB90BE55000000000, 0x000000A18F07D736}}, // e =  29
    {{0x0000000000000000, 0x0000000000000000, 0x674EDEA400000000, 0x000000C9F2C9CD04}}, // e =  30
    {{0x0000000000000000, 0x0000000000000000, 0x8122964D00000000, 0x000000FC6F7C4045}}, // e =  31
    {{0x0000000000000000, 0x0000000000000000, 0x70B59DF020000000, 0x0000009DC5ADA82B}}, // e =  32
    {{0x0000000000000000, 0x0000000000000000, 0x4CE3056C28000000, 0x000000C537191236}}, // e =  33
    {{0x0000000000000000, 0x0000000000000000, 0xE01BC6C732000000, 0x000000F684DF56C3}}, // e =  34
    {{0x0000000000000000, 0x0000000000000000, 0x6C115C3C7F400000, 0x0000009A130B963A}}, // e =  35
    {{0x0000000000000000, 0x0000000000000000, 0x0715B34B9F100000, 0x000000C097CE7BC9}}, // e =  36
    {{0x0000000000000000, 0x0000000000000000, 0x48DB201E86D40000, 0x000000F0BDC21ABB}}, // e =  37
    {{0x0000000000000000, 0x0000000000000000, 0x0D88F41314448000, 0x00000096769950B5}}, // e =  38
};

// Least significant word first.
constexpr bidconv::impl::Uint256 Multipliers2[TableSize] = {
    {{0xA9BAD09D6ABC40F4, 0xB3EA0D010ED46378, 0x848CD2EE66C3CFE4, 0x0000004BE2B05D35}}, // e = -80
    {{0xD42984C4C56B5131, 0xE0E4904152897C56, 0xE5B007AA0074C3DD, 0x0000005EDB5C7482}}, // e = -79
    {{0x8933E5F5F6C6257D, 0x591DB451A72BDB6C, 0x9F1C09948091F4D5, 0x00000076923391A3}}, // e = -78
    {{0xD5C06FB9BA3BD76E, 0x57B290B3087B6923, 0x437185FCD05B3905, 0x0000004A1B603B06}}, // e = -77
    {{0xCB308BA828CACD4A, 0xAD9F34DFCA9A436C, 0xD44DE77C04720746, 0x0000005CA23849C7}}, // e = -76
    {{0xFDFCAE9232FD809C, 0x59070217BD40D447, 0xC961615B058E8918, 0x00000073CAC65C39}}, // e = -75
    {{0xFEBDED1B5FDE7062, 0x37A4614ED64884AC, 0x1DDCDCD8E37915AF, 0x000000485EBBF9A4}}, // e = -74
    {{0x3E6D686237D60C7A, 0x058D79A28BDAA5D8, 0x2554140F1C575B1B, 0x0000005A766AF80D}}, // e = -73
    {{0x4E08C27AC5CB8F99, 0xC6F0D80B2ED14F4E, 0x6EA91912E36D31E1, 0x000000711405B610}}, // e = -72
    {{0xF0C5798CBB9F39C0, 0x1C568706FD42D190, 0x4529AFABCE243F2D, 0x00000046AC8391CA}}, // e = -71
    {{0x2CF6D7EFEA87082F, 0x636C28C8BC9385F5, 0xD6741B96C1AD4EF8, 0x0000005857A4763C}}, // e = -70
    {{0x78348DEBE528CA3B, 0x7C4732FAEBB86772, 0x0C11227C7218A2B6, 0x0000006E6D8D93CC}}, // e = -69
    {{0x8B20D8B36F397E65, 0x0DAC7FDCD35340A7, 0x878AB58DC74F65B2, 0x0000004504787C5F}}, // e = -68
    {{0x6DE90EE04B07DDFE, 0x91179FD4082810D1, 0x696D62F139233F1E, 0x0000005645969B77}}, // e = -67
    {{0xC96352985DC9D57E, 0x355D87C90A321505, 0x43C8BBAD876C0EE6, 0x0000006BD6FC4255}}, // e = -66
    {{0x9DDE139F3A9E256F, 0xE15A74DDA65F4D23, 0x4A5D754C74A3894F, 0x00000043665DA975}}, // e = -65
    {{0x855598870945AECA, 0xD9B112150FF7206C, 0x9CF4D29F91CC6BA3, 0x000000543FF513D2}}, // e = -64
    {{0xA6AAFEA8CB971A7D, 0xD01D569A53F4E887, 0x44320747763F868C, 0x000000694FF258C7}}, // e = -63
    {{0xC82ADF297F3E708E, 0x0212562074791154, 0x8A9F448CA9E7B418, 0x00000041D1F7777C}}, // e = -62
    {{0xFA3596F3DF0E0CB2, 0x0296EBA8919755A9, 0xAD4715AFD461A11E, 0x000000524675555B}}, // e = -61
    {{0x78C2FCB0D6D18FDE, 0x833CA692B5FD2B14, 0x9898DB1BC97A0965, 0x00000066D812AAB2}}, // e = -60
    {{0xCB79DDEE8642F9EB, 0x7205E81BB1BE3AEC, 0x9F5F88F15DEC45DF, 0x00000040470BAAAF}}, // e = -59
    {{0xFE58556A27D3B865, 0x4E8762229E2DC9A7, 0x87376B2DB5675757, 0x0000005058CE955B}}, // e = -58
    {{0xFDEE6AC4B1C8A67F, 0x22293AAB45B93C11, 0x690545F922C12D2D, 0x000000646F023AB2}}, // e = -57
    {{0x7D6A0575DE3AD01E, 0x6AB3895617278B16, 0x034697776B717878, 0x0000007D8AC2C95F}}, // e = -56
    {{0x0E624369AAE4C213, 0x42B035D5CE78B6EE, 0x620C1EAAA326EB4B, 0x0000004E76B9BDDB}}, // e = -55
    {{0x91FAD444159DF298, 0x135C434B4216E4A9, 0x3A8F26554BF0A61E, 0x0000006214682D52}}, // e = -54
    {{0xF67989551B056F3D, 0x9833541E129C9DD3, 0xC932EFEA9EECCFA5, 0x0000007A998238A6}}, // e = -53
    {{0x7A0BF5D530E36587, 0x7F201492CBA1E2A4, 0x3DBFD5F2A35401C7, 0x0000004C9FF16368}}, // e = -52
    {{0x988EF34A7D1C3EE8, 0x5EE819B77E8A5B4D, 0x4D2FCB6F4C290239, 0x0000005FC7EDBC42}}, // e = -51
    {{0xFEB2B01D1C634EA2, 0xB6A220255E2CF220, 0xE07BBE4B1F3342C7, 0x00000077B9E92B52}}, // e = -50
    {{0x9F2FAE1231BE1125, 0xD22554175ADC1754, 0xCC4D56EEF38009BC, 0x0000004AD431BB13}}, // e = -49
    {{0xC6FB9996BE2D956F, 0x06AEA91D31931D29, 0xBF60ACAAB0600C2C, 0x0000005D893E29D8}}, // e = -48
    {{0x38BA7FFC6DB8FACA, 0x085A53647DF7E474, 0xEF38D7D55C780F37, 0x00000074EB8DB44E}}, // e = -47
    {{0xA3748FFDC4939CBF, 0x6538741ECEBAEEC8, 0x558386E559CB0982, 0x00000049133890B1}}, // e = -46
    {{0xCC51B3FD35B883EE, 0xFE8691268269AA7A, 0xAAE4689EB03DCBE2, 0x0000005B5806B4DD}}, // e = -45
    {{0x7F6620FC8326A4EA, 0xBE28357023041519, 0x159D82C65C4D3EDB, 0x000000722E086215}}, // e = -44
    {{0xEF9FD49DD1F82712, 0x56D9216615E28D2F, 0x2D8271BBF9B04749, 0x000000475CC53D4D}}, // e = -43
    {{0xEB87C9C5467630D7, 0xAC8F69BF9B5B307B, 0x78E30E2AF81C591B, 0x0000005933F68CA0}}, // e = -42
    {{0xE669BC369813BD0C, 0x97B3442F8231FC9A, 0x971BD1B5B6236F62, 0x0000006F80F42FC8}}, // e = -41
    {{0xD00215A21F0C5628, 0x9ED00A9DB15F3DE0, 0x5E71631191D6259D, 0x00000045B0989DDD}}, // e = -40
    {{0x04029B0AA6CF6BB2, 0x06840D451DB70D59, 0xB60DBBD5F64BAF05, 0x000000571CBEC554}}, // e = -39
    {{0x450341CD5083469E, 0x482510966524D0AF, 0xE3912ACB73DE9AC6, 0x0000006CE3EE76A9}}, // e = -38
    {{0x8B22092052520C23, 0xED172A5DFF37026D, 0x2E3ABABF286B20BB, 0x000000440E750A2A}}, // e = -37
    {{0xEDEA8B6866E68F2B, 0xE85CF4F57F04C308, 0xB9C9696EF285E8EA, 0x0000005512124CB4}}, // e = -36
    {{0x29652E4280A032F6, 0xA2743232DEC5F3CB, 0xE83BC3CAAF276325, 0x0000006A5696DFE1}}, // e = -35
    {{0xF9DF3CE990641FDA, 0x85889F5FCB3BB85E, 0x31255A5EAD789DF7, 0x00000042761E4BED}}, // e = -34
    {{0xB8570C23F47D27D0, 0x66EAC737BE0AA676, 0x7D6EB0F658D6C575, 0x0000005313A5DEE8}}, // e = -33
    {{0x666CCF2CF19C71C4, 0xC0A57905AD8D5014, 0x9CCA5D33EF0C76D2, 0x00000067D88F56A2}}, // e = -32
    {{0xC004017C1701C71B, 0xB8676BA38C78520C, 0xA1FE7A407567CA43, 0x00000040E7599625}}, // e = -31
    {{0xF00501DB1CC238E1, 0xA681468C6F96668F, 0x0A7E18D092C1BCD4, 0x00000051212FFBAF}}, // e = -30
    {{0xEC064251E3F2C71A, 0xD021982F8B7C0033, 0xCD1D9F04B7722C09, 0x00000065697BFA9A}}, // e = -29
    {{0xE707D2E65CEF78E0, 0x4429FE3B6E5B0040, 0x806506C5E54EB70C, 0x0000007EC3DAF941}}, // e = -28
    {{0x9064E3CFFA15AB8C, 0xAA9A3EE524F8E028, 0xF03F243BAF513267, 0x0000004F3A68DBC8}}, // e = -27
    {{0xB47E1CC3F89B166F, 0x9540CE9E6E371832, 0x2C4EED4A9B257F01, 0x00000063090312BB}}, // e = -26
    {{0x619DA3F4F6C1DC0B, 0xFA91024609C4DE3F, 0xF762A89D41EEDEC1, 0x0000007BCB43D769}}, // e = -25
    {{0x9D0286791A392987, 0x3C9AA16BC61B0AE7, 0x3A9DA96249354B39, 0x0000004D5F0A66A2}}, // e = -24
    {{0x8443281760C773E9, 0x8BC149C6B7A1CDA1, 0xC94513BADB829E07, 0x00000060B6CD004A}}, // e = -23
    {{0xE553F21D38F950E3, 0x6EB19C38658A4109, 0x7B9658A992634589, 0x00000078E480405D}}, // e = -22
    {{0x2F547752439BD28E, 0xE52F01A33F7668A6, 0x6D3DF769FB7E0B75, 0x0000004B8ED0283A}}, // e = -21
    {{0xBB299526D482C731, 0x5E7AC20C0F5402CF, 0x088D75447A5D8E53, 0x0000005E72843249}}, // e = -20
    {{0xA9F3FA7089A378FD, 0x3619728F13290383, 0x4AB0D29598F4F1E8, 0x000000760F253EDB}}, // e = -19
    {{0x4A387C8656062B9E, 0x21CFE7996BF9A232, 0x0EAE839D7F991731, 0x00000049C9774749}}, // e = -18
    {{0xDCC69BA7EB87B686, 0x6A43E17FC6F80ABE, 0x525A2484DF7F5CFD, 0x0000005C3BD5191B}}, // e = -17
    {{0x93F84291E669A427, 0xC4D4D9DFB8B60D6E, 0x26F0ADA6175F343C, 0x000000734ACA5F62}}, // e = -16
    {{0x1C7B299B30020699, 0xFB05082BD371C865, 0x58566C87CE9B80A5, 0x000000480EBE7B9D}}, // e = -15
    {{0x6399F401FC02883F, 0x79C64A36C84E3A7E, 0xAE6C07A9C24260CF, 0x0000005A126E1A84}}, // e = -14
    {{0xFC8071027B032A4E, 0x5837DCC47A61C91D, 0xDA07099432D2F903, 0x000000709709A125}}, // e = -13
    {{0xBDD046A18CE1FA71, 0x1722E9FACC7D1DB2, 0xA84465FC9FC3DBA2, 0x000000465E6604B7}}, // e = -12
    {{0x6D445849F01A790D, 0x9CEBA4797F9C651F, 0x92557F7BC7B4D28A, 0x00000057F5FF85E5}}, // e = -11
    {{0x48956E5C6C211751, 0x44268D97DF837E67, 0xF6EADF5AB9A2072D, 0x0000006DF37F675E}}, // e = -10
    {{0x8D5D64F9C394AE93, 0x4A98187EEBB22F00, 0x5A52CB98B405447C, 0x00000044B82FA09B}}, // e =  -9
    {{0xB0B4BE383479DA37, 0x5D3E1E9EA69EBAC0, 0x30E77E7EE106959B, 0x00000055E63B88C2}}, // e =  -8
    {{0xDCE1EDC6419850C5, 0x348DA64650466970, 0xBD215E1E99483B02, 0x0000006B5FCA6AF2}}, // e =  -7
    {{0x8A0D349BE8FF327B, 0x60D887EBF22C01E6, 0xB634DAD31FCD24E1, 0x000000431BDE82D7}}, // e =  -6
    {{0x2C9081C2E33EFF1A, 0xB90EA9E6EEB70260, 0xA3C21187E7C06E19, 0x00000053E2D6238D}}, // e =  -5
    {{0x37B4A2339C0EBEE0, 0x27525460AA64C2F8, 0x0CB295E9E1B089A0, 0x00000068DB8BAC71}}, // e =  -4
    {{0x22D0E5604189374C, 0x189374BC6A7EF9DB, 0xA7EF9DB22D0E5604, 0x0000004189374BC6}}, // e =  -3
    {{0xEB851EB851EB851F, 0x1EB851EB851EB851, 0x51EB851EB851EB85, 0x00000051EB851EB8}}, // e =  -2
    {{0x6666666666666667, 0x6666666666666666, 0x6666666666666666, 0x0000006666666666}}, // e =  -1
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000004000000000}}, // e =   0
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000005000000000}}, // e =   1
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000006400000000}}, // e =   2
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000007D00000000}}, // e =   3
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000004E20000000}}, // e =   4
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x00000061A8000000}}, // e =   5
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000007A12000000}}, // e =   6
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000004C4B400000}}, // e =   7
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000005F5E100000}}, // e =   8
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000007735940000}}, // e =   9
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000004A817C8000}}, // e =  10
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000005D21DBA000}}, // e =  11
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000746A528800}}, // e =  12
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x00000048C2739500}}, // e =  13
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x0000005AF3107A40}}, // e =  14
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x00000071AFD498D0}}, // e =  15
    {{0x0000000000000000, 0x0000000000000000, 0x0000000000000000, 0x000000470DE4DF82}}, // e =  16
    {{0x0000000000000000, 0x0000000000000000, 0x8000000000000000, 0x00000058D15E1762}}, // e =  17
    {{0x0000000000000000, 0x0000000000000000, 0x2000000000000000, 0x0000006F05B59D3B}}, // e =  18
    {{0x0000000000000000, 0x0000000000000000, 0xF400000000000000, 0x0000004563918244}}, // e =  19
    {{0x0000000000000000, 0x0000000000000000, 0x3100000000000000, 0x00000056BC75E2D6}}, // e =  20
    {{0x0000000000000000, 0x0000000000000000, 0xBD40000000000000, 0x0000006C6B935B8B}}, // e =  21
    {{0x0000000000000000, 0x0000000000000000, 0x5648000000000000, 0x00000043C33C1937}}, // e =  22
    {{0x0000000000000000, 0x0000000000000000, 0x2BDA000000000000, 0x00000054B40B1F85}}, // e =  23
    {{0x0000000000000000, 0x0000000000000000, 0x76D0800000000000, 0x00000069E10DE766}}, // e =  24
    {{0x0000000000000000, 0x0000000000000000, 0x0A42500000000000, 0x000000422CA8B0A0}}, // e =  25
    {{0x0000000000000000, 0x0000000000000000, 0x0CD2E40000000000, 0x00000052B7D2DCC8}}, // e =  26
    {{0x0000000000000000, 0x0000000000000000, 0x10079D0000000000, 0x0000006765C793FA}}, // e =  27
    {{0x0000000000000000, 0x0000000000000000, 0x4A04C22000000000, 0x000000409F9CBC7C}}, // e =  28
    {{0x0000000000000000, 0x0000000000000000, 0x5C85F2A800000000, 0x00000050C783EB9B}}, // e =  29
    {{0x0000000000000000, 0x0000000000000000, 0x33A76F5200000000, 0x00000064F964E682}}, // e =  30
    {{0x0000000000000000, 0x0000000000000000, 0xC0914B2680000000, 0x0000007E37BE2022}}, // e =  31
    {{0x0000000000000000, 0x0000000000000000, 0xB85ACEF810000000, 0x0000004EE2D6D415}}, // e =  32
    {{0x0000000000000000, 0x0000000000000000, 0x267182B614000000, 0x000000629B8C891B}}, // e =  33
    {{0x0000000000000000, 0x0000000000000000, 0xF00DE36399000000, 0x0000007B426FAB61}}, // e =  34
    {{0x0000000000000000, 0x0000000000000000, 0x3608AE1E3FA00000, 0x0000004D0985CB1D}}, // e =  35
    {{0x0000000000000000, 0x0000000000000000, 0x838AD9A5CF880000, 0x000000604BE73DE4}}, // e =  36
    {{0x0000000000000000, 0x0000000000000000, 0xA46D900F436A0000, 0x000000785EE10D5D}}, // e =  37
    {{0x0000000000000000, 0x0000000000000000, 0x86C47A098A224000, 0x0000004B3B4CA85A}}, // e =  38
};

constexpr bidconv::impl::uint64x2 RoundBoundaries[4] = {
    {0x8000000000000000, 0x0000000000000000}, // positive, even
    {0x7FFFFFFFFFFFFFFF, 0xFFFFFFFFFFFFFFFF}, // positive, odd
    {0x8000000000000000, 0x0000000000000000}, // negative, even
    {0x7FFFFFFFFFFFFFFF, 0xFFFFFFFFFFFFFFFF}, // negative, odd
};

} // namespace

//==================================================================================================
//
//==================================================================================================

static inline unsigned TableIndex(int e)
{
    BIDCONV_ASSERT(e >= bidconv::impl::MinTableExponent);
    BIDCONV_ASSERT(e <= bidconv::impl::MaxTableExponent);
    return static_cast<unsigned>(e - bidconv::impl::MinTableExponent);
}

bidconv::impl::uint64x2 bidconv::impl::Breakpoint(int e)
{
    return Breakpoints[TableIndex(e)];
}

int bidconv::impl::BaseExponent(int e)
{
    return Exponents[TableIndex(e)];
}

bidconv::impl::Uint256 const& bidconv::impl::Multiplier1(int e)
{
    return Multipliers1[TableIndex(e)];
}

bidconv::impl::Uint256 const& bidconv::impl::Multiplier2(int e)
{
    return Multipliers2[TableIndex(e)];
}

bidconv::impl::uint64x2 bidconv::impl::RoundBoundary(int index)
{
    BIDCONV_ASSERT(index >= 0);
    BIDCONV_ASSERT(index <= 3);
    return RoundBoundaries[index];
}
